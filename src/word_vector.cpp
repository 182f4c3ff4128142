/**
 * @file word_vector.cpp
 * @brief WordVector growth and canonicalization.
 */

#include <tailbits/word_vector.hpp>

#include <utility>

namespace tailbits {

WordVector::WordVector(std::vector<word_t> words, Tail tail) : words_(std::move(words)), tail_(tail) {
    canonicalize();
}

void WordVector::ensure_word_at(std::size_t k) {
    if (k >= words_.size()) {
        words_.resize(k + 1, tail_word());
    }
}

void WordVector::resize(std::size_t num_words) {
    words_.resize(num_words, tail_word());
}

void WordVector::canonicalize() noexcept {
    const word_t pattern = tail_word();
    std::size_t n = words_.size();
    while (n > 0 && words_[n - 1] == pattern) {
        --n;
    }
    words_.resize(n);
}

bool WordVector::is_canonical() const noexcept {
    return words_.empty() || words_.back() != tail_word();
}

void WordVector::reset(Tail tail) noexcept {
    words_.clear();
    tail_ = tail;
}

} // namespace tailbits
