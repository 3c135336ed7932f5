/**
 * @file serialize.hpp
 * @brief Byte stream persistence for BitLongVec.
 *
 * @par Stream Layout (all integers little-endian)
 * | Offset | Size | Field                              |
 * |--------|------|------------------------------------|
 * | 0      | 4    | magic "BLV1"                       |
 * | 4      | 1    | bit width (1-64)                   |
 * | 5      | 3    | reserved, must be zero             |
 * | 8      | 8    | length (number of slots)           |
 * | 16     | 8*W  | W packed storage words             |
 *
 * W is words_required(length, bit_width). The words are stored exactly as
 * held in memory, so the packed layout is preserved bit for bit.
 */

#ifndef BITLONGVEC_SERIALIZE_HPP
#define BITLONGVEC_SERIALIZE_HPP

#include "bit_long_vec.hpp"
#include "config.hpp"
#include "error.hpp"

namespace bitlongvec {

inline constexpr std::uint8_t STREAM_MAGIC[4] = {'B', 'L', 'V', '1'};
inline constexpr std::size_t STREAM_HEADER_BYTES = 16U;

/**
 * @brief Number of bytes serialize() writes for @p vec.
 */
[[nodiscard]] inline std::size_t serialized_size(const BitLongVec& vec) noexcept {
    return STREAM_HEADER_BYTES + vec.size_bytes();
}

/**
 * @brief Write a vector to a byte buffer.
 *
 * @param vec Source vector
 * @param output Destination buffer
 * @param output_size Capacity of the destination buffer
 * @param[out] written Bytes written on success
 * @return Error::Ok or Error::BufferOverflow
 */
Error serialize(const BitLongVec& vec, std::uint8_t* output, std::size_t output_size,
                std::size_t& written) noexcept;

/**
 * @brief Read a vector from a byte buffer.
 *
 * The whole buffer must be consumed; trailing bytes are rejected.
 *
 * @param input Source buffer
 * @param input_size Size of the source buffer
 * @param[out] out Receives the vector on success, untouched on failure
 * @return Error::Ok, Error::Underflow, Error::InvalidData or
 *         Error::CapacityOverflow
 */
Error deserialize(const std::uint8_t* input, std::size_t input_size, BitLongVec& out);

} // namespace bitlongvec

#endif // BITLONGVEC_SERIALIZE_HPP
