/**
 * @file error.hpp
 * @brief bitlongvec error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The error-code API is always available; exceptions can be compiled out
 * with BITLONGVEC_NO_EXCEPTIONS=1.
 */

#ifndef BITLONGVEC_ERROR_HPP
#define BITLONGVEC_ERROR_HPP

#include "config.hpp"

#if !BITLONGVEC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitlongvec {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,                ///< Success
    InvalidBitWidth = -1,  ///< Bit width is 0 or wider than a storage word
    IndexOutOfBounds = -2, ///< Index is not below the vector length
    ValueOverflow = -3,    ///< Value does not fit in the bit width
    LengthMismatch = -4,   ///< Word count does not match length and bit width
    CapacityOverflow = -5, ///< length * bit width does not fit in size_t
    BufferOverflow = -6,   ///< Destination buffer too small
    Underflow = -7,        ///< Source buffer too short
    InvalidData = -8       ///< Invalid/corrupted packed data
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
    case Error::InvalidBitWidth:
        return "Bit width must be between 1 and 64";
    case Error::IndexOutOfBounds:
        return "Index out of bounds";
    case Error::ValueOverflow:
        return "Value exceeds maximum";
    case Error::LengthMismatch:
        return "Data length does not match capacity";
    case Error::CapacityOverflow:
        return "Capacity too large";
    case Error::BufferOverflow:
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    case Error::InvalidData:
        return "Invalid or corrupted data";
    default:
        return "Unknown error";
    }
}

#if !BITLONGVEC_NO_EXCEPTIONS

/**
 * @brief Base exception for bitlongvec errors.
 */
class BitLongVecException : public std::runtime_error {
public:
    BitLongVecException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a bit width outside [1, 64].
 */
class InvalidBitWidthException : public BitLongVecException {
public:
    explicit InvalidBitWidthException(const std::string& message)
        : BitLongVecException(message, Error::InvalidBitWidth) {}
};

/**
 * @brief Exception for an index past the end of the vector.
 */
class IndexOutOfBoundsException : public BitLongVecException {
public:
    explicit IndexOutOfBoundsException(const std::string& message)
        : BitLongVecException(message, Error::IndexOutOfBounds) {}
};

/**
 * @brief Exception for a value wider than the slot.
 */
class ValueOverflowException : public BitLongVecException {
public:
    explicit ValueOverflowException(const std::string& message)
        : BitLongVecException(message, Error::ValueOverflow) {}
};

class LengthMismatchException : public BitLongVecException {
public:
    explicit LengthMismatchException(const std::string& message)
        : BitLongVecException(message, Error::LengthMismatch) {}
};

class CapacityOverflowException : public BitLongVecException {
public:
    explicit CapacityOverflowException(const std::string& message)
        : BitLongVecException(message, Error::CapacityOverflow) {}
};

class BufferOverflowException : public BitLongVecException {
public:
    explicit BufferOverflowException(const std::string& message)
        : BitLongVecException(message, Error::BufferOverflow) {}
};

class UnderflowException : public BitLongVecException {
public:
    explicit UnderflowException(const std::string& message)
        : BitLongVecException(message, Error::Underflow) {}
};

class InvalidDataException : public BitLongVecException {
public:
    explicit InvalidDataException(const std::string& message)
        : BitLongVecException(message, Error::InvalidData) {}
};

/**
 * @brief Throw the exception matching an error code.
 *
 * Does nothing for Error::Ok.
 *
 * @param error Error code
 */
inline void throw_on_error(Error error) {
    const std::string message = error_string(error);
    switch (error) {
    case Error::Ok:
        return;
    case Error::InvalidBitWidth:
        throw InvalidBitWidthException(message);
    case Error::IndexOutOfBounds:
        throw IndexOutOfBoundsException(message);
    case Error::ValueOverflow:
        throw ValueOverflowException(message);
    case Error::LengthMismatch:
        throw LengthMismatchException(message);
    case Error::CapacityOverflow:
        throw CapacityOverflowException(message);
    case Error::BufferOverflow:
        throw BufferOverflowException(message);
    case Error::Underflow:
        throw UnderflowException(message);
    case Error::InvalidData:
        throw InvalidDataException(message);
    default:
        throw BitLongVecException(message, error);
    }
}

#endif // !BITLONGVEC_NO_EXCEPTIONS

} // namespace bitlongvec

#endif // BITLONGVEC_ERROR_HPP
