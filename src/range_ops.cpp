/**
 * @file range_ops.cpp
 * @brief Ranged mutation and slicing.
 */

#include <tailbits/bitops.hpp>
#include <tailbits/range_ops.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace tailbits {

namespace range {

namespace {

enum class Mode { Clear, Set, Flip };

inline void apply_mask(word_t& word, word_t mask, Mode mode) noexcept {
    switch (mode) {
    case Mode::Clear:
        word &= ~mask;
        break;
    case Mode::Set:
        word |= mask;
        break;
    case Mode::Flip:
        word ^= mask;
        break;
    }
}

/**
 * Touches each word of the span exactly once: partial masks for the
 * boundary words, full masks for the interior.
 */
Error apply_range(WordVector& vec, std::size_t from, std::size_t to, Mode mode) {
    if (from > to) {
        return Error::IndexError;
    }

    // Writing the tail's own value only touches the explicit words
    if ((mode == Mode::Clear && vec.tail() == Tail::Zero) ||
        (mode == Mode::Set && vec.tail() == Tail::One)) {
        to = std::min(to, vec.bit_length());
    }
    if (from >= to) {
        return Error::Ok;
    }

    const std::size_t first = from >> WORD_SHIFT;
    const std::size_t last = (to - 1) >> WORD_SHIFT;
    vec.ensure_word_at(last);

    const std::size_t lo = from & WORD_MASK;
    const std::size_t hi = ((to - 1) & WORD_MASK) + 1;

    if (first == last) {
        apply_mask(vec.word(first), detail::range_mask(lo, hi), mode);
    } else {
        apply_mask(vec.word(first), detail::range_mask(lo, BITS_PER_WORD), mode);
        for (std::size_t k = first + 1; k < last; ++k) {
            apply_mask(vec.word(k), ALL_ONES, mode);
        }
        apply_mask(vec.word(last), detail::low_mask(hi), mode);
    }

    vec.canonicalize();
    return Error::Ok;
}

} // namespace

void assign(WordVector& vec, std::size_t pos, int value) {
    const std::size_t k = pos >> WORD_SHIFT;
    const word_t bit = word_t{1} << (pos & WORD_MASK);

    // Writing the tail's own value past the explicit words changes nothing
    if (k >= vec.size() && (value != 0) == (vec.tail() == Tail::One)) {
        return;
    }

    vec.ensure_word_at(k);
    if (value) {
        vec.word(k) |= bit;
    } else {
        vec.word(k) &= ~bit;
    }
    vec.canonicalize();
}

void flip(WordVector& vec, std::size_t pos) {
    const std::size_t k = pos >> WORD_SHIFT;
    vec.ensure_word_at(k);
    vec.word(k) ^= word_t{1} << (pos & WORD_MASK);
    vec.canonicalize();
}

Error assign_range(WordVector& vec, std::size_t from, std::size_t to, int value) {
    return apply_range(vec, from, to, value ? Mode::Set : Mode::Clear);
}

Error flip_range(WordVector& vec, std::size_t from, std::size_t to) {
    return apply_range(vec, from, to, Mode::Flip);
}

Error slice(const WordVector& vec, std::size_t from, std::size_t to, WordVector& out) {
    if (from > to) {
        return Error::IndexError;
    }

    const std::size_t length = to - from;
    const std::size_t num_words = (length + BITS_PER_WORD - 1) >> WORD_SHIFT;
    const std::size_t base = from >> WORD_SHIFT;
    const std::size_t shift = from & WORD_MASK;

    std::vector<word_t> words(num_words);
    for (std::size_t j = 0; j < num_words; ++j) {
        words[j] = detail::funnel_right(vec.word_or_tail(base + j), vec.word_or_tail(base + j + 1),
                                        shift);
    }

    // Mask off bits beyond the requested length in the last word
    const std::size_t extra_bits = length & WORD_MASK;
    if (num_words > 0 && extra_bits != 0) {
        words[num_words - 1] &= detail::low_mask(extra_bits);
    }

    out = WordVector(std::move(words), Tail::Zero);
    return Error::Ok;
}

} // namespace range

} // namespace tailbits
