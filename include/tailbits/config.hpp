/**
 * @file config.hpp
 * @brief tailbits compile-time configuration.
 *
 * Word geometry and library limits shared by every module. A bit set is
 * stored as a sequence of 32-bit words where word k holds bits
 * [32k, 32k + 32) and bit 0 of a word is the lowest index it covers.
 */

#ifndef TAILBITS_CONFIG_HPP
#define TAILBITS_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <limits>

namespace tailbits {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Upper bound on the number of bits BitSet::random() will generate
#ifndef TAILBITS_MAX_RANDOM_BITS
#define TAILBITS_MAX_RANDOM_BITS (1U << 24U)
#endif

inline constexpr std::size_t MAX_RANDOM_BITS = TAILBITS_MAX_RANDOM_BITS;

/// 32-bit word type for bit set storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;
inline constexpr std::size_t WORD_SHIFT = 5U;
inline constexpr std::size_t WORD_MASK = BITS_PER_WORD - 1U;

/// Word with every bit set
inline constexpr word_t ALL_ONES = ~word_t{0};

/// Signed index type accepted at the public boundary (negative is rejected)
using index_t = std::int64_t;

/// Returned by scans when no set bit exists
inline constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

/** @} */

} // namespace tailbits

#endif // TAILBITS_CONFIG_HPP
