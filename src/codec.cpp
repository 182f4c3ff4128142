/**
 * @file codec.cpp
 * @brief Text, integer, index and byte conversions.
 */

#include <tailbits/bitops.hpp>
#include <tailbits/codec.hpp>
#include <tailbits/scanner.hpp>

#include <algorithm>
#include <utility>

namespace tailbits {

namespace codec {

namespace {

constexpr const char* DIGITS = "0123456789abcdefghijklmnopqrstuv";

/// Marker prepended to the rendering of an indefinite set
constexpr const char* INDEFINITE_PREFIX = "...";

int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string_view strip_prefix(std::string_view text, char marker) noexcept {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == marker || text[1] == marker - 32)) {
        return text.substr(2);
    }
    return text;
}

/**
 * Digits are most significant first. bits_per_digit divides BITS_PER_WORD,
 * so a digit never straddles two words.
 */
Error parse_digits(std::string_view digits, std::size_t bits_per_digit, WordVector& out) {
    if (digits.empty()) {
        return Error::ParseError;
    }

    const int radix = 1 << bits_per_digit;
    const std::size_t total_bits = digits.size() * bits_per_digit;
    std::vector<word_t> words((total_bits + BITS_PER_WORD - 1) >> WORD_SHIFT, 0);

    for (std::size_t i = 0; i < digits.size(); ++i) {
        int value = digit_value(digits[i]);
        if (value < 0 || value >= radix) {
            return Error::ParseError;
        }
        std::size_t pos = (digits.size() - 1 - i) * bits_per_digit;
        words[pos >> WORD_SHIFT] |= static_cast<word_t>(value) << (pos & WORD_MASK);
    }

    out = WordVector(std::move(words), Tail::Zero);
    return Error::Ok;
}

std::size_t digit_width(unsigned base) noexcept {
    switch (base) {
    case 2:
        return 1;
    case 4:
        return 2;
    case 8:
        return 3;
    case 16:
        return 4;
    case 32:
        return 5;
    default:
        return 0;
    }
}

struct InputParser {
    WordVector& out;

    Error operator()(const std::string& text) const {
        return parse_text(text, out);
    }

    Error operator()(std::uint64_t value) const {
        from_integer(value, out);
        return Error::Ok;
    }

    Error operator()(const IndexList& indices) const {
        return from_indices(indices, out);
    }

    Error operator()(const ByteSequence& seq) const {
        from_bytes(seq.bytes.data(), seq.bytes.size(), seq.order, out);
        return Error::Ok;
    }
};

} // namespace

Error parse_binary(std::string_view text, WordVector& out) {
    return parse_digits(strip_prefix(text, 'b'), 1, out);
}

Error parse_hex(std::string_view text, WordVector& out) {
    return parse_digits(strip_prefix(text, 'x'), 4, out);
}

Error parse_text(std::string_view text, WordVector& out) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return parse_digits(text.substr(2), 4, out);
    }
    return parse_binary(text, out);
}

void from_integer(std::uint64_t value, WordVector& out) {
    std::vector<word_t> words{static_cast<word_t>(value),
                              static_cast<word_t>(value >> BITS_PER_WORD)};
    out = WordVector(std::move(words), Tail::Zero);
}

Error from_indices(const IndexList& indices, WordVector& out) {
    std::int64_t highest = -1;
    for (std::int64_t index : indices) {
        if (index < 0) {
            return Error::ParseError;
        }
        highest = std::max(highest, index);
    }

    const std::size_t num_words =
        highest < 0 ? 0 : (static_cast<std::size_t>(highest) >> WORD_SHIFT) + 1;
    std::vector<word_t> words(num_words);
    for (std::int64_t index : indices) {
        auto pos = static_cast<std::size_t>(index);
        words[pos >> WORD_SHIFT] |= word_t{1} << (pos & WORD_MASK);
    }

    out = WordVector(std::move(words), Tail::Zero);
    return Error::Ok;
}

void from_bytes(const std::uint8_t* bytes, std::size_t num_bytes, ByteOrder order,
                WordVector& out) {
    std::vector<word_t> words((num_bytes + 3) / 4, 0);

    for (std::size_t i = 0; i < num_bytes; ++i) {
        // Position of this byte counted from the least significant end
        std::size_t k = (order == ByteOrder::LittleEndian) ? i : num_bytes - 1 - i;
        words[k / 4] |= static_cast<word_t>(bytes[i]) << ((k % 4) * 8);
    }

    out = WordVector(std::move(words), Tail::Zero);
}

Error parse(const Input& input, WordVector& out) {
    return std::visit(InputParser{out}, input);
}

Error to_string(const WordVector& vec, unsigned base, std::string& out) {
    const std::size_t width = digit_width(base);
    if (width == 0) {
        return Error::InvalidArg;
    }

    const std::size_t num_digits = (vec.bit_length() + width - 1) / width;
    const char pad = vec.tail() == Tail::One ? DIGITS[base - 1] : '0';

    std::string digits;
    digits.reserve(num_digits);
    for (std::size_t k = num_digits; k-- > 0;) {
        std::size_t pos = k * width;
        std::size_t word_idx = pos >> WORD_SHIFT;
        word_t chunk = detail::funnel_right(vec.word_or_tail(word_idx),
                                            vec.word_or_tail(word_idx + 1), pos & WORD_MASK);
        digits.push_back(DIGITS[chunk & detail::low_mask(width)]);
    }

    std::size_t start = digits.find_first_not_of(pad);
    digits.erase(0, start == std::string::npos ? digits.size() : start);

    if (vec.tail() == Tail::One) {
        out = INDEFINITE_PREFIX + std::string(4, pad) + digits;
    } else {
        out = digits.empty() ? "0" : std::move(digits);
    }
    return Error::Ok;
}

Error to_array(const WordVector& vec, std::vector<std::size_t>& out) {
    if (vec.tail() == Tail::One) {
        return Error::UndefinedForIndefiniteSet;
    }

    out.clear();
    for (std::size_t k = 0; k < vec.size(); ++k) {
        word_t word = vec.word(k);
        int bit;
        while ((bit = detail::extract_lsb(word)) >= 0) {
            out.push_back(k * BITS_PER_WORD + static_cast<std::size_t>(bit));
        }
    }
    return Error::Ok;
}

Error to_bytes(const WordVector& vec, ByteOrder order, std::vector<std::uint8_t>& out) {
    std::size_t highest = npos;
    Error result = scan::msb(vec, highest);
    if (result != Error::Ok) {
        return result;
    }

    out.clear();
    if (highest == npos) {
        return Error::Ok;
    }

    const std::size_t num_bytes = highest / 8 + 1;
    out.resize(num_bytes);
    for (std::size_t k = 0; k < num_bytes; ++k) {
        auto byte = static_cast<std::uint8_t>((vec.word(k / 4) >> ((k % 4) * 8)) & 0xFFU);
        std::size_t i = (order == ByteOrder::LittleEndian) ? k : num_bytes - 1 - k;
        out[i] = byte;
    }
    return Error::Ok;
}

} // namespace codec

} // namespace tailbits
