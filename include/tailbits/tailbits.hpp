/**
 * @file tailbits.hpp
 * @brief Single include for the tailbits library.
 *
 * Pulls in the BitSet API together with the lower-level word vector,
 * algebra, scan, range, shift and codec modules it is built on.
 */

#ifndef TAILBITS_HPP
#define TAILBITS_HPP

#include "algebra.hpp"
#include "bitops.hpp"
#include "bitset.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "range_ops.hpp"
#include "scanner.hpp"
#include "shift_ops.hpp"
#include "word_vector.hpp"

namespace tailbits {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace tailbits

#endif // TAILBITS_HPP
