/**
 * @file shift_ops.cpp
 * @brief Left and right shifts with cross-word carry.
 */

#include <tailbits/bitops.hpp>
#include <tailbits/shift_ops.hpp>

#include <utility>
#include <vector>

namespace tailbits {

namespace shift {

void left(WordVector& vec, std::size_t count) {
    if (count == 0 || (vec.empty() && vec.tail() == Tail::Zero)) {
        return;
    }

    const std::size_t word_shift = count >> WORD_SHIFT;
    const std::size_t bit_shift = count & WORD_MASK;
    const std::size_t n = vec.size();

    // One extra word receives the carry out of the old top word
    std::vector<word_t> words(n + word_shift + 1, 0);
    for (std::size_t i = word_shift; i < words.size(); ++i) {
        const std::size_t src = i - word_shift;
        word_t word = vec.word_or_tail(src) << bit_shift;
        if (bit_shift != 0 && src > 0) {
            word |= vec.word(src - 1) >> (BITS_PER_WORD - bit_shift);
        }
        words[i] = word;
    }

    vec = WordVector(std::move(words), vec.tail());
}

void right(WordVector& vec, std::size_t count) {
    if (count == 0) {
        return;
    }

    const std::size_t word_shift = count >> WORD_SHIFT;
    const std::size_t bit_shift = count & WORD_MASK;
    const std::size_t n = vec.size();

    // Every explicit bit falls off the low end; only the tail remains
    if (word_shift >= n) {
        vec.reset(vec.tail());
        return;
    }

    std::vector<word_t> words(n - word_shift);
    for (std::size_t i = 0; i < words.size(); ++i) {
        words[i] = detail::funnel_right(vec.word_or_tail(i + word_shift),
                                        vec.word_or_tail(i + word_shift + 1), bit_shift);
    }

    vec = WordVector(std::move(words), vec.tail());
}

} // namespace shift

} // namespace tailbits
