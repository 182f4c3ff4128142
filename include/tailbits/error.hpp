/**
 * @file error.hpp
 * @brief tailbits error handling.
 *
 * Core routines report failures as Error codes; the BitSet API converts a
 * failing code into the matching exception through raise().
 */

#ifndef TAILBITS_ERROR_HPP
#define TAILBITS_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace tailbits {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                        ///< Success
    InvalidArg = -1,               ///< Invalid argument (unsupported base, size limit)
    ParseError = -2,               ///< Malformed text, index list or byte input
    IndexError = -3,               ///< Negative index or reversed range
    UndefinedForIndefiniteSet = -4 ///< Operation needs a finite set
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::ParseError:
        return "Malformed input";
    case Error::IndexError:
        return "Index out of range";
    case Error::UndefinedForIndefiniteSet:
        return "Undefined for indefinite set";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for tailbits errors.
 */
class BitSetException : public std::runtime_error {
public:
    explicit BitSetException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public BitSetException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : BitSetException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for malformed parser input.
 */
class ParseException : public BitSetException {
public:
    explicit ParseException(const std::string& message)
        : BitSetException(message, Error::ParseError) {}
};

/**
 * @brief Exception for negative indices and reversed ranges.
 */
class IndexException : public BitSetException {
public:
    explicit IndexException(const std::string& message)
        : BitSetException(message, Error::IndexError) {}
};

/**
 * @brief Exception for operations that need a finite set.
 */
class IndefiniteSetException : public BitSetException {
public:
    explicit IndefiniteSetException(const std::string& message)
        : BitSetException(message, Error::UndefinedForIndefiniteSet) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * @param error Error code (must not be Error::Ok)
 * @param context Operation name prefixed to the message
 */
[[noreturn]] inline void raise(Error error, const std::string& context) {
    std::string message = context + ": " + error_string(error);
    switch (error) {
    case Error::ParseError:
        throw ParseException(message);
    case Error::IndexError:
        throw IndexException(message);
    case Error::UndefinedForIndefiniteSet:
        throw IndefiniteSetException(message);
    default:
        throw InvalidArgumentException(message);
    }
}

/**
 * @brief Throw if an error code is not Error::Ok.
 */
inline void check(Error error, const char* context) {
    if (error != Error::Ok) [[unlikely]] {
        raise(error, context);
    }
}

} // namespace tailbits

#endif // TAILBITS_ERROR_HPP
