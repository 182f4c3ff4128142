/**
 * @file scanner.cpp
 * @brief Most/least significant bit and population count.
 */

#include <tailbits/bitops.hpp>
#include <tailbits/scanner.hpp>

namespace tailbits {

namespace scan {

Error msb(const WordVector& vec, std::size_t& index) noexcept {
    if (vec.tail() == Tail::One) {
        return Error::UndefinedForIndefiniteSet;
    }

    for (std::size_t k = vec.size(); k-- > 0;) {
        word_t word = vec.word(k);
        if (word != 0) {
            index = k * BITS_PER_WORD + detail::highest_bit(word);
            return Error::Ok;
        }
    }

    index = npos;
    return Error::Ok;
}

std::size_t lsb(const WordVector& vec) noexcept {
    for (std::size_t k = 0; k < vec.size(); ++k) {
        word_t word = vec.word(k);
        if (word != 0) {
            return k * BITS_PER_WORD + detail::lowest_bit(word);
        }
    }

    // All explicit words are zero: the first tail bit, if any, is the answer
    if (vec.tail() == Tail::One) {
        return vec.bit_length();
    }
    return npos;
}

Error popcount(const WordVector& vec, std::size_t& count) noexcept {
    if (vec.tail() == Tail::One) {
        return Error::UndefinedForIndefiniteSet;
    }

    std::size_t total = 0;
    for (word_t word : vec.words()) {
        total += detail::popcount(word);
    }
    count = total;
    return Error::Ok;
}

} // namespace scan

} // namespace tailbits
