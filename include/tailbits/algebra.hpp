/**
 * @file algebra.hpp
 * @brief Bitwise algebra between WordVectors of any length and tail.
 *
 * Operands of different explicit lengths are combined as if the shorter one
 * were extended with its own tail pattern; the result tail is the same
 * operation applied to the two tails. An indefinite set therefore behaves
 * exactly as if its missing high words were materialized as all ones.
 */

#ifndef TAILBITS_ALGEBRA_HPP
#define TAILBITS_ALGEBRA_HPP

#include "word_vector.hpp"

namespace tailbits {

namespace algebra {

/**
 * @brief Binary operations.
 */
enum class Op {
    And,   ///< a & b
    Or,    ///< a | b
    Xor,   ///< a ^ b
    AndNot ///< a & ~b
};

/**
 * @brief Combine two vectors into a new canonical vector.
 *
 * @param op Operation
 * @param a First operand
 * @param b Second operand
 * @return Result, owning its own storage
 */
[[nodiscard]] WordVector apply(Op op, const WordVector& a, const WordVector& b);

/**
 * @brief Complement of a vector (tail is inverted as well).
 */
[[nodiscard]] WordVector complement(const WordVector& a);

/**
 * @brief Whether two vectors denote the same set.
 *
 * Equivalent to apply(Op::Xor, a, b) being empty, without allocating.
 */
[[nodiscard]] bool equals(const WordVector& a, const WordVector& b) noexcept;

} // namespace algebra

} // namespace tailbits

#endif // TAILBITS_ALGEBRA_HPP
