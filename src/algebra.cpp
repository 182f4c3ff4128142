/**
 * @file algebra.cpp
 * @brief AND, OR, XOR, AND-NOT, NOT and equality.
 */

#include <tailbits/algebra.hpp>

#include <algorithm>
#include <utility>

namespace tailbits {

namespace algebra {

namespace {

template <typename F>
WordVector combine(const WordVector& a, const WordVector& b, F f) {
    const std::size_t n = std::max(a.size(), b.size());

    std::vector<word_t> words(n);
    for (std::size_t i = 0; i < n; ++i) {
        words[i] = f(a.word_or_tail(i), b.word_or_tail(i));
    }

    // Tail words are all-zero or all-one, so f maps them to one of the two
    Tail tail = f(a.tail_word(), b.tail_word()) != 0 ? Tail::One : Tail::Zero;

    return WordVector(std::move(words), tail);
}

} // namespace

WordVector apply(Op op, const WordVector& a, const WordVector& b) {
    switch (op) {
    case Op::And:
        return combine(a, b, [](word_t x, word_t y) { return static_cast<word_t>(x & y); });
    case Op::Or:
        return combine(a, b, [](word_t x, word_t y) { return static_cast<word_t>(x | y); });
    case Op::Xor:
        return combine(a, b, [](word_t x, word_t y) { return static_cast<word_t>(x ^ y); });
    case Op::AndNot:
        return combine(a, b, [](word_t x, word_t y) { return static_cast<word_t>(x & ~y); });
    }
    return WordVector();
}

WordVector complement(const WordVector& a) {
    std::vector<word_t> words(a.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        words[i] = ~a.word(i);
    }
    Tail tail = a.tail() == Tail::One ? Tail::Zero : Tail::One;
    return WordVector(std::move(words), tail);
}

bool equals(const WordVector& a, const WordVector& b) noexcept {
    if (a.tail() != b.tail()) {
        return false;
    }

    const std::size_t n = std::max(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (a.word_or_tail(i) != b.word_or_tail(i)) {
            return false;
        }
    }
    return true;
}

} // namespace algebra

} // namespace tailbits
