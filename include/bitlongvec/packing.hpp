/**
 * @file packing.hpp
 * @brief Slot addressing and bit-field primitives for packed storage.
 *
 * @par Bit Numbering Convention
 * - Stream bit 0 = LSB of word 0
 * - Stream bit 64 = LSB of word 1
 *
 * Slot i of a B-bit vector occupies stream bits [i*B, i*B + B), with the
 * lowest stream bit holding the least significant bit of the value. Since
 * B never exceeds the word size, a slot touches at most two adjacent words.
 */

#ifndef BITLONGVEC_PACKING_HPP
#define BITLONGVEC_PACKING_HPP

#include <limits>

#include "config.hpp"

namespace bitlongvec {

/**
 * @brief Words touched by a single slot.
 */
struct SlotSpan {
    std::size_t start_word;   ///< Word holding the slot's lowest bit
    std::size_t start_offset; ///< Bit position of the slot inside start_word
    std::size_t end_word;     ///< Word holding the slot's highest bit

    [[nodiscard]] constexpr bool spans_two_words() const noexcept {
        return start_word != end_word;
    }
};

/**
 * @brief Mask with the low @p bits bits set.
 *
 * @param bits Number of bits (0-64); 64 or more gives all ones
 * @return Mask value
 */
[[nodiscard]] constexpr word_t low_mask(std::size_t bits) noexcept {
    if (bits >= BITS_PER_WORD) {
        return ~word_t{0};
    }
    return (word_t{1} << bits) - 1U;
}

/**
 * @brief Largest value representable in @p bit_width bits.
 */
[[nodiscard]] constexpr word_t max_value(std::size_t bit_width) noexcept {
    return low_mask(bit_width);
}

[[nodiscard]] constexpr bool is_valid_bit_width(std::size_t bit_width) noexcept {
    return bit_width >= 1U && bit_width <= MAX_BIT_WIDTH;
}

/**
 * @brief Check that length * bit_width is representable.
 */
[[nodiscard]] constexpr bool fits_capacity(std::size_t length, std::size_t bit_width) noexcept {
    return bit_width == 0 || length <= std::numeric_limits<std::size_t>::max() / bit_width;
}

/**
 * @brief Number of storage words needed for @p length slots.
 *
 * @warning Caller must ensure fits_capacity(length, bit_width).
 * @return ceil(length * bit_width / 64)
 */
[[nodiscard]] constexpr std::size_t words_required(std::size_t length,
                                                   std::size_t bit_width) noexcept {
    const std::size_t total_bits = length * bit_width;
    return total_bits / BITS_PER_WORD + ((total_bits % BITS_PER_WORD) != 0 ? 1U : 0U);
}

/**
 * @brief Map a logical index to the words holding its bits.
 *
 * @param index Logical slot index
 * @param bit_width Bits per slot (1-64)
 * @return Start word, intra-word offset and end word
 */
[[nodiscard]] constexpr SlotSpan locate(std::size_t index, std::size_t bit_width) noexcept {
    const std::size_t start_bit = index * bit_width;
    const std::size_t end_bit = start_bit + bit_width - 1U;
    return SlotSpan{start_bit / BITS_PER_WORD, start_bit % BITS_PER_WORD,
                    end_bit / BITS_PER_WORD};
}

/**
 * @brief Read the B-bit field described by @p span.
 *
 * @param words Storage words (must contain span.end_word)
 * @param span Result of locate()
 * @param bit_width Bits per slot
 * @return Field value
 */
[[nodiscard]] inline word_t extract(const word_t* words, const SlotSpan& span,
                                    std::size_t bit_width) noexcept {
    word_t value = words[span.start_word] >> span.start_offset;

    if (span.spans_two_words()) [[unlikely]] {
        // start_offset > 0 here, so the shift stays below 64
        const std::size_t low_bits = BITS_PER_WORD - span.start_offset;
        value |= words[span.end_word] << low_bits;
    }

    return value & low_mask(bit_width);
}

/**
 * @brief Overwrite the B-bit field described by @p span.
 *
 * Only bits of the field are modified.
 *
 * @warning Caller must ensure value <= max_value(bit_width).
 * @param words Storage words (must contain span.end_word)
 * @param span Result of locate()
 * @param bit_width Bits per slot
 * @param value New field value
 */
inline void deposit(word_t* words, const SlotSpan& span, std::size_t bit_width,
                    word_t value) noexcept {
    const word_t mask = low_mask(bit_width);

    // Bits shifted past the top of the word belong to end_word
    words[span.start_word] &= ~(mask << span.start_offset);
    words[span.start_word] |= value << span.start_offset;

    if (span.spans_two_words()) [[unlikely]] {
        const std::size_t low_bits = BITS_PER_WORD - span.start_offset;
        const std::size_t high_bits = bit_width - low_bits;

        words[span.end_word] &= ~low_mask(high_bits);
        words[span.end_word] |= value >> low_bits;
    }
}

} // namespace bitlongvec

#endif // BITLONGVEC_PACKING_HPP
