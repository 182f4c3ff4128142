/**
 * @file scanner.hpp
 * @brief Bit scans over a WordVector.
 *
 * Scans walk the explicit words and resolve the hit inside a word with the
 * single-word primitives from bitops.hpp.
 */

#ifndef TAILBITS_SCANNER_HPP
#define TAILBITS_SCANNER_HPP

#include "config.hpp"
#include "error.hpp"
#include "word_vector.hpp"

namespace tailbits {

namespace scan {

/**
 * @brief Index of the most significant set bit.
 *
 * Scans downward from the highest explicit word.
 *
 * @param vec Canonical vector
 * @param[out] index Highest set bit, or npos if the set is empty
 * @return Error::Ok, or Error::UndefinedForIndefiniteSet for a tail of One
 */
Error msb(const WordVector& vec, std::size_t& index) noexcept;

/**
 * @brief Index of the least significant set bit.
 *
 * For an indefinite set the result is always finite: at the latest the
 * first tail bit.
 *
 * @return Lowest set bit, or npos for the empty set
 */
[[nodiscard]] std::size_t lsb(const WordVector& vec) noexcept;

/**
 * @brief Number of trailing zeros, identical to lsb().
 */
[[nodiscard]] inline std::size_t ntz(const WordVector& vec) noexcept {
    return lsb(vec);
}

/**
 * @brief Number of set bits (Hamming weight).
 *
 * @param[out] count Number of bits set to 1
 * @return Error::Ok, or Error::UndefinedForIndefiniteSet for a tail of One
 */
Error popcount(const WordVector& vec, std::size_t& count) noexcept;

} // namespace scan

} // namespace tailbits

#endif // TAILBITS_SCANNER_HPP
