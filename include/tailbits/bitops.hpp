/**
 * @file bitops.hpp
 * @brief Constant-time single-word bit primitives.
 *
 * Every scan in the library reduces to these helpers so that scanning cost
 * is proportional to the number of words, never to the number of bits.
 */

#ifndef TAILBITS_BITOPS_HPP
#define TAILBITS_BITOPS_HPP

#include "config.hpp"

namespace tailbits {

namespace detail {

/**
 * @brief Index of the highest set bit of a word.
 *
 * @param word Word to inspect (must be non-zero)
 * @return Position of the highest set bit (0-31)
 */
inline std::size_t highest_bit(word_t word) noexcept {
    return (BITS_PER_WORD - 1U) - static_cast<std::size_t>(__builtin_clz(word));
}

/**
 * @brief Index of the lowest set bit of a word.
 *
 * @param word Word to inspect (must be non-zero)
 * @return Position of the lowest set bit (0-31)
 */
inline std::size_t lowest_bit(word_t word) noexcept {
    return static_cast<std::size_t>(__builtin_ctz(word));
}

/**
 * @brief Extract and clear the least significant set bit from a word.
 *
 * The loop termination of set-bit enumeration is bounded by popcount.
 *
 * @param word Reference to the word (will be modified to clear the LSB)
 * @return Position of the LSB (0-31), or -1 if word was zero
 */
inline int extract_lsb(word_t& word) noexcept {
    if (word == 0) {
        return -1;
    }
    int ctz = __builtin_ctz(word);
    word &= word - 1; // Clear LSB (standard idiom)
    return ctz;
}

/**
 * @brief Number of set bits in a word.
 */
inline std::size_t popcount(word_t word) noexcept {
    return static_cast<std::size_t>(__builtin_popcount(word));
}

/**
 * @brief Mask with the low @p n bits set (n may equal BITS_PER_WORD).
 */
inline constexpr word_t low_mask(std::size_t n) noexcept {
    return n >= BITS_PER_WORD ? ALL_ONES : static_cast<word_t>((word_t{1} << n) - 1U);
}

/**
 * @brief Mask with bits [lo, hi) set, 0 <= lo <= hi <= BITS_PER_WORD.
 */
inline constexpr word_t range_mask(std::size_t lo, std::size_t hi) noexcept {
    return low_mask(hi) & ~low_mask(lo);
}

/**
 * @brief Combine two adjacent words into the 32 bits starting at @p shift.
 *
 * Returns bits [shift, shift + 32) of the 64-bit value (high:low).
 */
inline constexpr word_t funnel_right(word_t low, word_t high, std::size_t shift) noexcept {
    if (shift == 0) {
        return low;
    }
    return static_cast<word_t>((low >> shift) | (high << (BITS_PER_WORD - shift)));
}

} // namespace detail

} // namespace tailbits

#endif // TAILBITS_BITOPS_HPP
