/**
 * @file bitset.hpp
 * @brief Unbounded bit set with finite and co-finite values.
 *
 * BitSet represents a set of non-negative integers of unbounded size. The
 * complement of a finite set is itself a valid value (an indefinite set),
 * so not_() never loses information.
 *
 * @par Value-Returning vs Mutating
 * and_(), or_(), xor_(), and_not(), not_(), clone() and slice() return a new
 * set that owns its storage and leave the operands untouched. set(),
 * clear(), flip(), set_range(), lshift() and rshift() modify the receiver
 * and return it for chaining.
 *
 * @par Errors
 * - ParseException: malformed construction input
 * - IndexException: negative index or from > to
 * - IndefiniteSetException: cardinality(), msb(), to_array(), to_bytes() or
 *   iteration on an indefinite set
 *
 * Instances are not synchronized. Concurrent reads of an unmodified set are
 * safe; writers must be serialized by the caller.
 */

#ifndef TAILBITS_BITSET_HPP
#define TAILBITS_BITSET_HPP

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "word_vector.hpp"

namespace tailbits {

/**
 * @brief Dense word-based bit set with an implicit tail.
 */
class BitSet {
public:
    /// Sentinel returned by msb(), lsb() and ntz() when no bit is set
    static constexpr std::size_t npos = tailbits::npos;

    /**
     * @brief Forward iterator over the ascending indices of set bits.
     *
     * Words are decoded lazily one at a time.
     */
    class SetBitIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::size_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::size_t*;
        using reference = std::size_t;

        /**
         * @brief End iterator.
         */
        SetBitIterator() noexcept = default;

        /**
         * @brief Iterator positioned on the first set bit of @p vec.
         */
        explicit SetBitIterator(const WordVector* vec) noexcept;

        [[nodiscard]] reference operator*() const noexcept {
            return index_;
        }

        SetBitIterator& operator++() noexcept {
            advance();
            return *this;
        }

        SetBitIterator operator++(int) noexcept {
            SetBitIterator previous = *this;
            advance();
            return previous;
        }

        [[nodiscard]] bool operator==(const SetBitIterator& other) const noexcept = default;

    private:
        const WordVector* vec_ = nullptr;
        std::size_t next_word_ = 0;
        std::size_t base_ = 0;
        word_t pending_ = 0;
        std::size_t index_ = 0;

        void advance() noexcept;
    };

    using const_iterator = SetBitIterator;

    /**
     * @brief Default constructor - the empty set.
     */
    BitSet() noexcept = default;

    /**
     * @brief Construct from any supported input shape.
     *
     * @throws ParseException on malformed input
     */
    explicit BitSet(const Input& input);

    /**
     * @brief Construct from binary text, or hexadecimal text with "0x".
     *
     * @throws ParseException on malformed text
     */
    explicit BitSet(const char* text);

    explicit BitSet(const std::string& text);

    /**
     * @brief Construct from the binary expansion of an integer.
     *
     * @throws ParseException if the value is negative
     */
    template <std::integral T>
    explicit BitSet(T value) {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                raise(Error::ParseError, "BitSet(integer)");
            }
        }
        codec::from_integer(static_cast<std::uint64_t>(value), vec_);
    }

    /**
     * @brief Construct with the listed indices set.
     *
     * @throws ParseException on a negative index
     */
    BitSet(std::initializer_list<std::int64_t> indices);

    /**
     * @brief Parse binary digits with optional "0b" prefix.
     */
    [[nodiscard]] static BitSet from_binary_string(std::string_view text);

    /**
     * @brief Parse hexadecimal digits with optional "0x" prefix.
     */
    [[nodiscard]] static BitSet from_hex_string(std::string_view text);

    [[nodiscard]] static BitSet from_integer(std::uint64_t value);

    [[nodiscard]] static BitSet from_indices(const IndexList& indices);

    [[nodiscard]] static BitSet from_bytes(const std::uint8_t* bytes, std::size_t num_bytes,
                                           ByteOrder order = ByteOrder::LittleEndian);

    /**
     * @brief Finite set of @p n uniformly random bits.
     *
     * @throws InvalidArgumentException if n exceeds MAX_RANDOM_BITS
     */
    [[nodiscard]] static BitSet random(std::size_t n);

    /**
     * @brief Reproducible variant of random(n).
     */
    [[nodiscard]] static BitSet random(std::size_t n, std::uint32_t seed);

    /** @name Value-returning algebra */
    /** @{ */
    [[nodiscard]] BitSet and_(const BitSet& other) const;
    [[nodiscard]] BitSet or_(const BitSet& other) const;
    [[nodiscard]] BitSet xor_(const BitSet& other) const;

    /**
     * @brief this AND NOT other (not to be confused with NAND).
     */
    [[nodiscard]] BitSet and_not(const BitSet& other) const;

    [[nodiscard]] BitSet not_() const;

    [[nodiscard]] BitSet clone() const {
        return *this;
    }
    /** @} */

    /**
     * @brief Same members, valid for indefinite sets as well.
     */
    [[nodiscard]] bool equals(const BitSet& other) const noexcept;

    [[nodiscard]] bool operator==(const BitSet& other) const noexcept {
        return equals(other);
    }

    [[nodiscard]] bool operator!=(const BitSet& other) const noexcept {
        return !equals(other);
    }

    /**
     * @brief Whether no bit is set.
     */
    [[nodiscard]] bool is_empty() const noexcept {
        return vec_.tail() == Tail::Zero && vec_.empty();
    }

    /**
     * @brief Whether all but finitely many bits are set.
     */
    [[nodiscard]] bool is_indefinite() const noexcept {
        return vec_.tail() == Tail::One;
    }

    /**
     * @brief Get bit value at position.
     *
     * @param index Bit position
     * @return Bit value (0 or 1)
     * @throws IndexException if index is negative
     */
    [[nodiscard]] int get(index_t index) const;

    /**
     * @brief Number of set bits.
     *
     * @throws IndefiniteSetException for an indefinite set
     */
    [[nodiscard]] std::size_t cardinality() const;

    /**
     * @brief Non-throwing cardinality().
     */
    Error try_cardinality(std::size_t& count) const noexcept;

    /**
     * @brief Index of the highest set bit (floor of log base two).
     *
     * @return Index, or npos for the empty set
     * @throws IndefiniteSetException for an indefinite set
     */
    [[nodiscard]] std::size_t msb() const;

    /**
     * @brief Non-throwing msb().
     */
    Error try_msb(std::size_t& index) const noexcept;

    /**
     * @brief Index of the lowest set bit, or npos for the empty set.
     */
    [[nodiscard]] std::size_t lsb() const noexcept;

    /**
     * @brief Number of trailing zeros, or npos for the empty set.
     */
    [[nodiscard]] std::size_t ntz() const noexcept;

    /**
     * @brief Bits [from, to) re-indexed from 0; always finite.
     *
     * @throws IndexException if from is negative or from > to
     */
    [[nodiscard]] BitSet slice(index_t from, index_t to) const;

    /**
     * @brief Bits from @p from up to the explicit length.
     */
    [[nodiscard]] BitSet slice(index_t from) const;

    /**
     * @brief The explicit bits as a finite set.
     */
    [[nodiscard]] BitSet slice() const;

    /** @name Mutation */
    /** @{ */

    /**
     * @brief Set every bit, producing the indefinite full set.
     */
    BitSet& set() noexcept;

    /**
     * @brief Set a single bit.
     *
     * @param index Bit position
     * @param value Bit value (0 or 1)
     * @return *this
     */
    BitSet& set(index_t index, int value = 1);

    /**
     * @brief Set every bit in [from, to).
     */
    BitSet& set_range(index_t from, index_t to, int value = 1);

    /**
     * @brief Reset to the empty set.
     */
    BitSet& clear() noexcept;

    BitSet& clear(index_t index);

    BitSet& clear(index_t from, index_t to);

    /**
     * @brief Complement the whole set in-place.
     */
    BitSet& flip() noexcept;

    BitSet& flip(index_t index);

    BitSet& flip(index_t from, index_t to);

    /**
     * @brief Shift left in-place (bit i moves to i + count).
     */
    BitSet& lshift(index_t count);

    /**
     * @brief Shift right in-place, without sign extension.
     */
    BitSet& rshift(index_t count);

    BitSet& operator<<=(index_t count) {
        return lshift(count);
    }

    BitSet& operator>>=(index_t count) {
        return rshift(count);
    }
    /** @} */

    /**
     * @brief Render in base 2, 4, 8, 16 or 32.
     *
     * @throws InvalidArgumentException for other bases
     */
    [[nodiscard]] std::string to_string(unsigned base = 2) const;

    /**
     * @brief Ascending list of set-bit indices.
     *
     * @throws IndefiniteSetException for an indefinite set
     */
    [[nodiscard]] std::vector<std::size_t> to_array() const;

    /**
     * @brief Minimal byte array covering the highest set bit.
     *
     * @throws IndefiniteSetException for an indefinite set
     */
    [[nodiscard]] std::vector<std::uint8_t> to_bytes(ByteOrder order = ByteOrder::LittleEndian) const;

    /**
     * @brief First set bit; each call starts a fresh traversal.
     *
     * @throws IndefiniteSetException for an indefinite set
     */
    [[nodiscard]] SetBitIterator begin() const;

    [[nodiscard]] SetBitIterator end() const noexcept {
        return SetBitIterator();
    }

    [[nodiscard]] Tail tail() const noexcept {
        return vec_.tail();
    }

    [[nodiscard]] std::size_t word_count() const noexcept {
        return vec_.size();
    }

    /**
     * @brief Read-only view of the explicit words.
     */
    [[nodiscard]] const std::vector<word_t>& words() const noexcept {
        return vec_.words();
    }

private:
    WordVector vec_;

    explicit BitSet(WordVector vec) noexcept : vec_(std::move(vec)) {}

    static std::size_t checked_index(index_t index, const char* context);
};

[[nodiscard]] inline BitSet operator&(const BitSet& a, const BitSet& b) {
    return a.and_(b);
}

[[nodiscard]] inline BitSet operator|(const BitSet& a, const BitSet& b) {
    return a.or_(b);
}

[[nodiscard]] inline BitSet operator^(const BitSet& a, const BitSet& b) {
    return a.xor_(b);
}

[[nodiscard]] inline BitSet operator~(const BitSet& a) {
    return a.not_();
}

/**
 * @brief Write the base 2 rendering.
 */
std::ostream& operator<<(std::ostream& os, const BitSet& bs);

} // namespace tailbits

#endif // TAILBITS_BITSET_HPP
