/**
 * @file range_ops.hpp
 * @brief Single-bit and ranged access over a WordVector.
 *
 * Ranges are half-open [from, to). Every mutation leaves the vector in
 * canonical form.
 */

#ifndef TAILBITS_RANGE_OPS_HPP
#define TAILBITS_RANGE_OPS_HPP

#include "config.hpp"
#include "error.hpp"
#include "word_vector.hpp"

namespace tailbits {

namespace range {

/**
 * @brief Get bit value at position.
 *
 * Positions past the explicit words read as the tail.
 *
 * @param vec Vector
 * @param pos Bit position
 * @return Bit value (0 or 1)
 */
[[nodiscard]] inline int get(const WordVector& vec, std::size_t pos) noexcept {
    word_t word = vec.word_or_tail(pos >> WORD_SHIFT);
    return static_cast<int>((word >> (pos & WORD_MASK)) & 1U);
}

/**
 * @brief Set bit value at position.
 *
 * @param vec Vector
 * @param pos Bit position
 * @param value Bit value (0 or 1)
 */
void assign(WordVector& vec, std::size_t pos, int value);

/**
 * @brief Invert the bit at position.
 */
void flip(WordVector& vec, std::size_t pos);

/**
 * @brief Set every bit in [from, to) to a value.
 *
 * @return Error::Ok, or Error::IndexError if from > to
 */
Error assign_range(WordVector& vec, std::size_t from, std::size_t to, int value);

/**
 * @brief Invert every bit in [from, to).
 *
 * @return Error::Ok, or Error::IndexError if from > to
 */
Error flip_range(WordVector& vec, std::size_t from, std::size_t to);

/**
 * @brief Copy bits [from, to) into a new finite vector starting at bit 0.
 *
 * Bits past the explicit words of @p vec are read as its tail, so a slice of
 * an indefinite set beyond its explicit length is all ones.
 *
 * @param vec Source vector
 * @param from First bit
 * @param to One past the last bit
 * @param[out] out Result (tail is always Zero)
 * @return Error::Ok, or Error::IndexError if from > to
 */
Error slice(const WordVector& vec, std::size_t from, std::size_t to, WordVector& out);

} // namespace range

} // namespace tailbits

#endif // TAILBITS_RANGE_OPS_HPP
