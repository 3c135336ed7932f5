/**
 * @file bitlongvec.hpp
 * @brief High-level bitlongvec API.
 *
 * Bulk conversion between plain value arrays and packed vectors, suitable
 * for file-level operations. Includes every public header of the library.
 */

#ifndef BITLONGVEC_HPP
#define BITLONGVEC_HPP

#include "bit_long_vec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "packing.hpp"
#include "serialize.hpp"

namespace bitlongvec {

/**
 * @brief Smallest bit width able to hold every value.
 *
 * @param values Input values
 * @param count Number of values
 * @return Bit width in [1, 64]; 1 when count is 0 or all values are 0
 */
[[nodiscard]] inline std::size_t min_bit_width(const word_t* values, std::size_t count) noexcept {
    word_t combined = 0;
    for (std::size_t i = 0; i < count; ++i) {
        combined |= values[i];
    }

    std::size_t width = 1;
    while (width < MAX_BIT_WIDTH && combined > max_value(width)) {
        ++width;
    }
    return width;
}

/**
 * @brief Pack an array of values into a new vector.
 *
 * @param values Input values
 * @param count Number of values (becomes the vector length)
 * @param bit_width Bits per slot (1-64)
 * @param[out] out Receives the vector on success, untouched on failure
 * @return Error::Ok, Error::InvalidBitWidth, Error::CapacityOverflow or
 *         Error::ValueOverflow
 */
inline Error pack(const word_t* values, std::size_t count, std::size_t bit_width,
                  BitLongVec& out) {
    BitLongVec packed;
    Error result = BitLongVec::create(count, bit_width, packed);
    if (result != Error::Ok) {
        return result;
    }

    for (std::size_t i = 0; i < count; ++i) {
        result = packed.try_set(i, values[i]);
        if (result != Error::Ok) {
            return result;
        }
    }

    out = std::move(packed);
    return Error::Ok;
}

/**
 * @brief Copy every value of a vector into a plain array.
 *
 * @param vec Source vector
 * @param output Destination array
 * @param output_capacity Number of elements available in output
 * @return Error::Ok or Error::BufferOverflow
 */
inline Error unpack(const BitLongVec& vec, word_t* output, std::size_t output_capacity) noexcept {
    if (output_capacity < vec.length()) {
        return Error::BufferOverflow;
    }

    for (std::size_t i = 0; i < vec.length(); ++i) {
        output[i] = vec.get_unchecked(i);
    }
    return Error::Ok;
}

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitlongvec

#endif // BITLONGVEC_HPP
