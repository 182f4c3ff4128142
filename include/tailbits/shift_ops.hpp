/**
 * @file shift_ops.hpp
 * @brief Whole-vector logical shifts by arbitrary bit counts.
 *
 * Shifts never change the tail. A left shift vacates low positions with
 * zeros; a right shift pulls bits down from the higher words and, once the
 * explicit words run out, from the tail pattern itself. Neither direction
 * turns an indefinite set into a finite one.
 */

#ifndef TAILBITS_SHIFT_OPS_HPP
#define TAILBITS_SHIFT_OPS_HPP

#include "config.hpp"
#include "word_vector.hpp"

namespace tailbits {

namespace shift {

/**
 * @brief Shift left in-place (bit i moves to i + count).
 */
void left(WordVector& vec, std::size_t count);

/**
 * @brief Shift right in-place (bit i moves to i - count, bits below 0 drop).
 */
void right(WordVector& vec, std::size_t count);

} // namespace shift

} // namespace tailbits

#endif // TAILBITS_SHIFT_OPS_HPP
