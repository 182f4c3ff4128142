/**
 * @file word_vector.hpp
 * @brief Growable word sequence with an implicit constant tail.
 *
 * A WordVector stores explicit words for the low end of the set and a tail
 * flag giving the value of every bit at or beyond size() * BITS_PER_WORD.
 * A tail of One describes a co-finite set whose complement is finite.
 *
 * @par Canonical Form
 * The highest explicit word never equals the all-tail pattern. The empty
 * set is tail Zero with no words. Mutating callers restore the invariant
 * with canonicalize() before handing the vector back to users.
 */

#ifndef TAILBITS_WORD_VECTOR_HPP
#define TAILBITS_WORD_VECTOR_HPP

#include <vector>

#include "config.hpp"

namespace tailbits {

/**
 * @brief Value of every bit beyond the explicit words.
 */
enum class Tail : std::uint8_t {
    Zero = 0, ///< Finite set
    One = 1   ///< Indefinite (co-finite) set
};

/**
 * @brief Explicit words plus tail flag.
 */
class WordVector {
public:
    /**
     * @brief Default constructor - the canonical empty set.
     */
    WordVector() noexcept = default;

    /**
     * @brief Construct from raw words and tail.
     *
     * The result is canonicalized.
     *
     * @param words Words, lowest index first
     * @param tail Tail value
     */
    WordVector(std::vector<word_t> words, Tail tail);

    /**
     * @brief Number of explicit words.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return words_.size();
    }

    /**
     * @brief Number of explicitly stored bits.
     */
    [[nodiscard]] std::size_t bit_length() const noexcept {
        return words_.size() * BITS_PER_WORD;
    }

    [[nodiscard]] bool empty() const noexcept {
        return words_.empty();
    }

    [[nodiscard]] Tail tail() const noexcept {
        return tail_;
    }

    void set_tail(Tail tail) noexcept {
        tail_ = tail;
    }

    /**
     * @brief Word whose every bit equals the tail.
     */
    [[nodiscard]] word_t tail_word() const noexcept {
        return tail_ == Tail::One ? ALL_ONES : word_t{0};
    }

    /**
     * @brief Word at index without bounds checking.
     *
     * @warning Caller must ensure k < size().
     */
    [[nodiscard]] word_t word(std::size_t k) const noexcept {
        return words_[k];
    }

    [[nodiscard]] word_t& word(std::size_t k) noexcept {
        return words_[k];
    }

    /**
     * @brief Word at index, or the tail pattern past the explicit words.
     */
    [[nodiscard]] word_t word_or_tail(std::size_t k) const noexcept {
        return k < words_.size() ? words_[k] : tail_word();
    }

    /**
     * @brief Grow with tail-valued words so that index k is explicit.
     */
    void ensure_word_at(std::size_t k);

    /**
     * @brief Set the explicit word count, padding with the tail pattern.
     *
     * Shrinking drops the high words, which changes the value unless the
     * dropped words equal the tail pattern.
     */
    void resize(std::size_t num_words);

    /**
     * @brief Trim trailing words equal to the all-tail pattern.
     */
    void canonicalize() noexcept;

    [[nodiscard]] bool is_canonical() const noexcept;

    /**
     * @brief Drop every word and set the tail.
     */
    void reset(Tail tail = Tail::Zero) noexcept;

    /**
     * @brief Read-only access to the explicit words.
     */
    [[nodiscard]] const std::vector<word_t>& words() const noexcept {
        return words_;
    }

    /**
     * @brief Structural equality of two canonical vectors.
     */
    [[nodiscard]] bool operator==(const WordVector& other) const noexcept = default;

private:
    std::vector<word_t> words_;
    Tail tail_ = Tail::Zero;
};

} // namespace tailbits

#endif // TAILBITS_WORD_VECTOR_HPP
