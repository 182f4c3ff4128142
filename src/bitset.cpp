/**
 * @file bitset.cpp
 * @brief BitSet construction, argument validation and delegation.
 *
 * The BitSet methods validate user-facing arguments, forward to the
 * algebra, scan, range, shift and codec modules, and turn their error codes
 * into exceptions.
 */

#include <tailbits/algebra.hpp>
#include <tailbits/bitops.hpp>
#include <tailbits/bitset.hpp>
#include <tailbits/range_ops.hpp>
#include <tailbits/scanner.hpp>
#include <tailbits/shift_ops.hpp>

#include <ostream>
#include <random>

namespace tailbits {

// ============================================================================
// SetBitIterator
// ============================================================================

BitSet::SetBitIterator::SetBitIterator(const WordVector* vec) noexcept : vec_(vec) {
    advance();
}

void BitSet::SetBitIterator::advance() noexcept {
    while (pending_ == 0) {
        if (next_word_ >= vec_->size()) {
            *this = SetBitIterator();
            return;
        }
        pending_ = vec_->word(next_word_);
        base_ = next_word_ * BITS_PER_WORD;
        ++next_word_;
    }
    index_ = base_ + static_cast<std::size_t>(detail::extract_lsb(pending_));
}

// ============================================================================
// Construction
// ============================================================================

BitSet::BitSet(const Input& input) {
    check(codec::parse(input, vec_), "BitSet(input)");
}

BitSet::BitSet(const char* text) {
    check(codec::parse_text(text, vec_), "BitSet(text)");
}

BitSet::BitSet(const std::string& text) {
    check(codec::parse_text(text, vec_), "BitSet(text)");
}

BitSet::BitSet(std::initializer_list<std::int64_t> indices) {
    check(codec::from_indices(IndexList(indices), vec_), "BitSet(indices)");
}

BitSet BitSet::from_binary_string(std::string_view text) {
    WordVector vec;
    check(codec::parse_binary(text, vec), "from_binary_string");
    return BitSet(std::move(vec));
}

BitSet BitSet::from_hex_string(std::string_view text) {
    WordVector vec;
    check(codec::parse_hex(text, vec), "from_hex_string");
    return BitSet(std::move(vec));
}

BitSet BitSet::from_integer(std::uint64_t value) {
    WordVector vec;
    codec::from_integer(value, vec);
    return BitSet(std::move(vec));
}

BitSet BitSet::from_indices(const IndexList& indices) {
    WordVector vec;
    check(codec::from_indices(indices, vec), "from_indices");
    return BitSet(std::move(vec));
}

BitSet BitSet::from_bytes(const std::uint8_t* bytes, std::size_t num_bytes, ByteOrder order) {
    WordVector vec;
    codec::from_bytes(bytes, num_bytes, order, vec);
    return BitSet(std::move(vec));
}

BitSet BitSet::random(std::size_t n) {
    std::random_device device;
    return random(n, device());
}

BitSet BitSet::random(std::size_t n, std::uint32_t seed) {
    if (n > MAX_RANDOM_BITS) {
        raise(Error::InvalidArg, "random");
    }

    std::mt19937 engine(seed);
    std::vector<word_t> words((n + BITS_PER_WORD - 1) >> WORD_SHIFT);
    for (word_t& word : words) {
        word = static_cast<word_t>(engine());
    }

    const std::size_t extra_bits = n & WORD_MASK;
    if (!words.empty() && extra_bits != 0) {
        words.back() &= detail::low_mask(extra_bits);
    }

    return BitSet(WordVector(std::move(words), Tail::Zero));
}

std::size_t BitSet::checked_index(index_t index, const char* context) {
    if (index < 0) {
        raise(Error::IndexError, context);
    }
    return static_cast<std::size_t>(index);
}

// ============================================================================
// Algebra
// ============================================================================

BitSet BitSet::and_(const BitSet& other) const {
    return BitSet(algebra::apply(algebra::Op::And, vec_, other.vec_));
}

BitSet BitSet::or_(const BitSet& other) const {
    return BitSet(algebra::apply(algebra::Op::Or, vec_, other.vec_));
}

BitSet BitSet::xor_(const BitSet& other) const {
    return BitSet(algebra::apply(algebra::Op::Xor, vec_, other.vec_));
}

BitSet BitSet::and_not(const BitSet& other) const {
    return BitSet(algebra::apply(algebra::Op::AndNot, vec_, other.vec_));
}

BitSet BitSet::not_() const {
    return BitSet(algebra::complement(vec_));
}

bool BitSet::equals(const BitSet& other) const noexcept {
    return algebra::equals(vec_, other.vec_);
}

// ============================================================================
// Queries
// ============================================================================

int BitSet::get(index_t index) const {
    return range::get(vec_, checked_index(index, "get"));
}

std::size_t BitSet::cardinality() const {
    std::size_t count = 0;
    check(try_cardinality(count), "cardinality");
    return count;
}

Error BitSet::try_cardinality(std::size_t& count) const noexcept {
    return scan::popcount(vec_, count);
}

std::size_t BitSet::msb() const {
    std::size_t index = npos;
    check(try_msb(index), "msb");
    return index;
}

Error BitSet::try_msb(std::size_t& index) const noexcept {
    return scan::msb(vec_, index);
}

std::size_t BitSet::lsb() const noexcept {
    return scan::lsb(vec_);
}

std::size_t BitSet::ntz() const noexcept {
    return scan::ntz(vec_);
}

BitSet BitSet::slice(index_t from, index_t to) const {
    std::size_t begin = checked_index(from, "slice");
    std::size_t end = checked_index(to, "slice");
    WordVector out;
    check(range::slice(vec_, begin, end, out), "slice");
    return BitSet(std::move(out));
}

BitSet BitSet::slice(index_t from) const {
    return slice(from, static_cast<index_t>(vec_.bit_length()));
}

BitSet BitSet::slice() const {
    return slice(0);
}

// ============================================================================
// Mutation
// ============================================================================

BitSet& BitSet::set() noexcept {
    vec_.reset(Tail::One);
    return *this;
}

BitSet& BitSet::set(index_t index, int value) {
    range::assign(vec_, checked_index(index, "set"), value);
    return *this;
}

BitSet& BitSet::set_range(index_t from, index_t to, int value) {
    std::size_t begin = checked_index(from, "set_range");
    std::size_t end = checked_index(to, "set_range");
    check(range::assign_range(vec_, begin, end, value), "set_range");
    return *this;
}

BitSet& BitSet::clear() noexcept {
    vec_.reset(Tail::Zero);
    return *this;
}

BitSet& BitSet::clear(index_t index) {
    return set(index, 0);
}

BitSet& BitSet::clear(index_t from, index_t to) {
    return set_range(from, to, 0);
}

BitSet& BitSet::flip() noexcept {
    for (std::size_t k = 0; k < vec_.size(); ++k) {
        vec_.word(k) = ~vec_.word(k);
    }
    vec_.set_tail(vec_.tail() == Tail::One ? Tail::Zero : Tail::One);
    // Complementing a canonical vector keeps it canonical
    return *this;
}

BitSet& BitSet::flip(index_t index) {
    range::flip(vec_, checked_index(index, "flip"));
    return *this;
}

BitSet& BitSet::flip(index_t from, index_t to) {
    std::size_t begin = checked_index(from, "flip");
    std::size_t end = checked_index(to, "flip");
    check(range::flip_range(vec_, begin, end), "flip");
    return *this;
}

BitSet& BitSet::lshift(index_t count) {
    shift::left(vec_, checked_index(count, "lshift"));
    return *this;
}

BitSet& BitSet::rshift(index_t count) {
    shift::right(vec_, checked_index(count, "rshift"));
    return *this;
}

// ============================================================================
// Rendering
// ============================================================================

std::string BitSet::to_string(unsigned base) const {
    std::string out;
    check(codec::to_string(vec_, base, out), "to_string");
    return out;
}

std::vector<std::size_t> BitSet::to_array() const {
    std::vector<std::size_t> out;
    check(codec::to_array(vec_, out), "to_array");
    return out;
}

std::vector<std::uint8_t> BitSet::to_bytes(ByteOrder order) const {
    std::vector<std::uint8_t> out;
    check(codec::to_bytes(vec_, order, out), "to_bytes");
    return out;
}

BitSet::SetBitIterator BitSet::begin() const {
    if (is_indefinite()) {
        raise(Error::UndefinedForIndefiniteSet, "begin");
    }
    return SetBitIterator(&vec_);
}

std::ostream& operator<<(std::ostream& os, const BitSet& bs) {
    return os << bs.to_string();
}

} // namespace tailbits
