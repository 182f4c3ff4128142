/**
 * @file codec.hpp
 * @brief Conversion between external representations and WordVector.
 *
 * Accepted input shapes form the closed variant Input, dispatched once by
 * parse(). Parsers report malformed input as Error::ParseError; renderers
 * that cannot materialize an infinite set report
 * Error::UndefinedForIndefiniteSet.
 *
 * @par Text Syntax
 * - Binary: optional "0b"/"0B" prefix, digits 0/1, most significant first
 * - Hexadecimal: "0x"/"0X" prefix, digits 0-9, a-f, A-F
 *
 * @par Byte Order
 * - LittleEndian: byte i holds bits [8i, 8i + 8), bit j of the byte is 8i + j
 * - BigEndian: the first byte is the most significant, the last holds bits 0-7
 */

#ifndef TAILBITS_CODEC_HPP
#define TAILBITS_CODEC_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "word_vector.hpp"

namespace tailbits {

/**
 * @brief Bit order of a byte sequence.
 */
enum class ByteOrder {
    LittleEndian, ///< First byte holds the lowest bits
    BigEndian     ///< First byte holds the highest bits
};

/// Indices of the bits to set (negative entries are rejected)
using IndexList = std::vector<std::int64_t>;

/**
 * @brief Raw bytes with their bit order.
 */
struct ByteSequence {
    std::vector<std::uint8_t> bytes;
    ByteOrder order = ByteOrder::LittleEndian;
};

/**
 * @brief Every input shape a BitSet can be constructed from.
 */
using Input = std::variant<std::string, std::uint64_t, IndexList, ByteSequence>;

namespace codec {

/**
 * @brief Parse binary digits, with or without the "0b" prefix.
 */
Error parse_binary(std::string_view text, WordVector& out);

/**
 * @brief Parse hexadecimal digits, with or without the "0x" prefix.
 */
Error parse_hex(std::string_view text, WordVector& out);

/**
 * @brief Parse text, choosing the base from its prefix.
 *
 * "0x" selects hexadecimal; "0b" or no prefix selects binary.
 */
Error parse_text(std::string_view text, WordVector& out);

/**
 * @brief Binary expansion of an unsigned integer.
 */
void from_integer(std::uint64_t value, WordVector& out);

/**
 * @brief Set exactly the listed indices.
 *
 * @return Error::Ok, or Error::ParseError on a negative index
 */
Error from_indices(const IndexList& indices, WordVector& out);

/**
 * @brief Load from byte array.
 *
 * @param bytes Source byte array
 * @param num_bytes Number of bytes to load
 * @param order Bit order of the bytes
 * @param[out] out Result (tail Zero)
 */
void from_bytes(const std::uint8_t* bytes, std::size_t num_bytes, ByteOrder order,
                WordVector& out);

/**
 * @brief Dispatch on the input shape.
 */
Error parse(const Input& input, WordVector& out);

/**
 * @brief Render in a power-of-two base.
 *
 * Finite sets render without leading zeros ("0" when empty). Indefinite
 * sets render as "..." followed by four maximal digits and the explicit
 * digits, for example "...11110101".
 *
 * @param vec Canonical vector
 * @param base 2, 4, 8, 16 or 32
 * @param[out] out Rendered text
 * @return Error::Ok, or Error::InvalidArg for an unsupported base
 */
Error to_string(const WordVector& vec, unsigned base, std::string& out);

/**
 * @brief Ascending list of set-bit indices.
 *
 * @return Error::Ok, or Error::UndefinedForIndefiniteSet
 */
Error to_array(const WordVector& vec, std::vector<std::size_t>& out);

/**
 * @brief Store to the minimal byte array covering the highest set bit.
 *
 * @return Error::Ok, or Error::UndefinedForIndefiniteSet
 */
Error to_bytes(const WordVector& vec, ByteOrder order, std::vector<std::uint8_t>& out);

} // namespace codec

} // namespace tailbits

#endif // TAILBITS_CODEC_HPP
