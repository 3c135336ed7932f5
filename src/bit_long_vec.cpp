/**
 * @file bit_long_vec.cpp
 * @brief BitLongVec construction and re-encoding.
 *
 * The per-slot get/set paths live in the header so they can be inlined
 * into callers; this unit holds the allocating operations.
 */

#include <bitlongvec/bit_long_vec.hpp>

namespace bitlongvec {

Error BitLongVec::validate_shape(std::size_t length, std::size_t bit_width) noexcept {
    if (!is_valid_bit_width(bit_width)) {
        return Error::InvalidBitWidth;
    }
    if (!fits_capacity(length, bit_width)) {
        return Error::CapacityOverflow;
    }
    return Error::Ok;
}

Error BitLongVec::create(std::size_t length, std::size_t bit_width, BitLongVec& out) {
    Error result = validate_shape(length, bit_width);
    if (result != Error::Ok) {
        return result;
    }

    // Value-initialised words: every slot reads back as 0
    out = BitLongVec(std::vector<word_t>(words_required(length, bit_width), 0U), length,
                     bit_width);
    return Error::Ok;
}

Error BitLongVec::from_data(std::vector<word_t> words, std::size_t length, std::size_t bit_width,
                            BitLongVec& out) {
    Error result = validate_shape(length, bit_width);
    if (result != Error::Ok) {
        return result;
    }
    if (words.size() != words_required(length, bit_width)) {
        return Error::LengthMismatch;
    }

    // Bits past the last slot are never written by set
    const std::size_t used_bits = (length * bit_width) % BITS_PER_WORD;
    if (!words.empty() && used_bits != 0 && (words.back() & ~low_mask(used_bits)) != 0) {
        return Error::InvalidData;
    }

    out = BitLongVec(std::move(words), length, bit_width);
    return Error::Ok;
}

Error BitLongVec::try_resize(std::size_t bit_width, BitLongVec& out) const {
    BitLongVec resized;
    Error result = create(length_, bit_width, resized);
    if (result != Error::Ok) {
        return result;
    }

    const word_t limit = resized.max_value();
    for (std::size_t i = 0; i < length_; ++i) {
        word_t value = get_unchecked(i);
        if (value > limit) {
            return Error::ValueOverflow;
        }
        resized.set_unchecked(i, value);
    }

    out = std::move(resized);
    return Error::Ok;
}

#if !BITLONGVEC_NO_EXCEPTIONS

BitLongVec BitLongVec::with_fixed_capacity(std::size_t length, std::size_t bit_width) {
    BitLongVec vec;
    throw_on_error(create(length, bit_width, vec));
    return vec;
}

BitLongVec BitLongVec::from_data(std::vector<word_t> words, std::size_t length,
                                 std::size_t bit_width) {
    BitLongVec vec;
    throw_on_error(from_data(std::move(words), length, bit_width, vec));
    return vec;
}

BitLongVec BitLongVec::resize(std::size_t bit_width) const {
    BitLongVec vec;
    throw_on_error(try_resize(bit_width, vec));
    return vec;
}

#endif // !BITLONGVEC_NO_EXCEPTIONS

} // namespace bitlongvec
