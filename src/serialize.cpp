/**
 * @file serialize.cpp
 * @brief BitLongVec byte stream encoding and decoding.
 */

#include <bitlongvec/serialize.hpp>

#include <cstring>
#include <utility>
#include <vector>

namespace bitlongvec {

namespace {

void store_le64(std::uint8_t* bytes, std::uint64_t value) noexcept {
    for (std::size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFFU);
    }
}

std::uint64_t load_le64(const std::uint8_t* bytes) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(bytes[i]) << (i * 8);
    }
    return value;
}

} // namespace

Error serialize(const BitLongVec& vec, std::uint8_t* output, std::size_t output_size,
                std::size_t& written) noexcept {
    const std::size_t total = serialized_size(vec);
    if (output_size < total) {
        return Error::BufferOverflow;
    }

    std::memcpy(output, STREAM_MAGIC, sizeof(STREAM_MAGIC));
    output[4] = static_cast<std::uint8_t>(vec.bit_width());
    output[5] = 0;
    output[6] = 0;
    output[7] = 0;
    store_le64(&output[8], static_cast<std::uint64_t>(vec.length()));

    std::uint8_t* cursor = &output[STREAM_HEADER_BYTES];
    for (word_t word : vec.words()) {
        store_le64(cursor, word);
        cursor += BYTES_PER_WORD;
    }

    written = total;
    return Error::Ok;
}

Error deserialize(const std::uint8_t* input, std::size_t input_size, BitLongVec& out) {
    if (input_size < STREAM_HEADER_BYTES) {
        return Error::Underflow;
    }
    if (std::memcmp(input, STREAM_MAGIC, sizeof(STREAM_MAGIC)) != 0) {
        return Error::InvalidData;
    }
    if (input[5] != 0 || input[6] != 0 || input[7] != 0) {
        return Error::InvalidData;
    }

    const std::size_t bit_width = input[4];
    if (!is_valid_bit_width(bit_width)) {
        return Error::InvalidData;
    }

    const std::size_t length = static_cast<std::size_t>(load_le64(&input[8]));
    if (!fits_capacity(length, bit_width)) {
        return Error::CapacityOverflow;
    }

    const std::size_t num_words = words_required(length, bit_width);
    const std::size_t payload = input_size - STREAM_HEADER_BYTES;
    if (num_words > payload / BYTES_PER_WORD) {
        return Error::Underflow;
    }
    if (payload != num_words * BYTES_PER_WORD) {
        return Error::InvalidData;
    }

    std::vector<word_t> words(num_words);
    const std::uint8_t* cursor = &input[STREAM_HEADER_BYTES];
    for (std::size_t i = 0; i < num_words; ++i) {
        words[i] = load_le64(cursor);
        cursor += BYTES_PER_WORD;
    }

    return BitLongVec::from_data(std::move(words), length, bit_width, out);
}

} // namespace bitlongvec
