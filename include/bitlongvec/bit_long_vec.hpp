/**
 * @file bit_long_vec.hpp
 * @brief Vector of fixed bit width values packed into 64-bit words.
 *
 * Reduces the memory needed for values whose width is not a power of two.
 * Storing 100 values of 10 bits takes 200 bytes as 16-bit integers but
 * only 16 words (128 bytes) here. The price is a few shifts and masks on
 * every get and set.
 *
 * @par Example
 * @code
 * auto vec = bitlongvec::BitLongVec::with_fixed_capacity(100, 10);
 * for (std::size_t i = 0; i < vec.length(); ++i) {
 *     vec.set(i, 1023);
 * }
 * @endcode
 *
 * @see packing.hpp for the bit layout
 */

#ifndef BITLONGVEC_BIT_LONG_VEC_HPP
#define BITLONGVEC_BIT_LONG_VEC_HPP

#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "packing.hpp"

namespace bitlongvec {

/**
 * @brief Fixed capacity vector of B-bit unsigned values.
 *
 * Length and bit width are set at construction and never change. All
 * slots start at zero. Not thread-safe; callers synchronise externally.
 */
class BitLongVec {
public:
    /**
     * @brief Construct an empty vector (length 0, bit width 1).
     *
     * Mostly useful as the output argument of the error-code factories.
     */
    BitLongVec() noexcept : length_(0), bit_width_(1) {}

    BitLongVec(const BitLongVec&) = default;
    BitLongVec& operator=(const BitLongVec&) = default;

    /**
     * @brief Move construct; the source is left empty (length 0, bit width 1).
     */
    BitLongVec(BitLongVec&& other) noexcept
        : data_(std::move(other.data_)), length_(std::exchange(other.length_, 0)),
          bit_width_(std::exchange(other.bit_width_, 1)) {
        other.data_.clear();
    }

    /**
     * @brief Move assign; the source is left empty (length 0, bit width 1).
     */
    BitLongVec& operator=(BitLongVec&& other) noexcept {
        if (this != &other) {
            data_ = std::move(other.data_);
            other.data_.clear();
            length_ = std::exchange(other.length_, 0);
            bit_width_ = std::exchange(other.bit_width_, 1);
        }
        return *this;
    }

    ~BitLongVec() = default;

    /**
     * @brief Create a zero-initialised vector.
     *
     * @param length Number of slots
     * @param bit_width Bits per slot (1-64)
     * @param[out] out Receives the vector on success, untouched on failure
     * @return Error::Ok, Error::InvalidBitWidth or Error::CapacityOverflow
     */
    static Error create(std::size_t length, std::size_t bit_width, BitLongVec& out);

    /**
     * @brief Adopt existing packed words as storage.
     *
     * Bits of the last word past the final slot must be zero, as they are in
     * every vector built through set.
     *
     * @param words Packed storage, exactly words_required(length, bit_width) long
     * @param length Number of slots
     * @param bit_width Bits per slot (1-64)
     * @param[out] out Receives the vector on success, untouched on failure
     * @return Error::Ok, Error::InvalidBitWidth, Error::CapacityOverflow,
     *         Error::LengthMismatch or Error::InvalidData
     */
    static Error from_data(std::vector<word_t> words, std::size_t length, std::size_t bit_width,
                           BitLongVec& out);

#if !BITLONGVEC_NO_EXCEPTIONS
    /**
     * @brief Create a zero-initialised vector.
     *
     * @throws InvalidBitWidthException if bit_width is 0 or greater than 64
     * @throws CapacityOverflowException if length * bit_width overflows
     */
    static BitLongVec with_fixed_capacity(std::size_t length, std::size_t bit_width);

    /**
     * @brief Adopt existing packed words as storage.
     *
     * @throws InvalidBitWidthException if bit_width is 0 or greater than 64
     * @throws LengthMismatchException if words has the wrong size
     * @throws InvalidDataException if bits past the last slot are set
     */
    static BitLongVec from_data(std::vector<word_t> words, std::size_t length,
                                std::size_t bit_width);
#endif

    [[nodiscard]] std::size_t length() const noexcept {
        return length_;
    }

    [[nodiscard]] std::size_t bit_width() const noexcept {
        return bit_width_;
    }

    [[nodiscard]] bool empty() const noexcept {
        return length_ == 0;
    }

    /**
     * @brief Largest value a slot can hold (2^bit_width - 1).
     */
    [[nodiscard]] word_t max_value() const noexcept {
        return bitlongvec::max_value(bit_width_);
    }

    /**
     * @brief Get the number of 64-bit storage words.
     */
    [[nodiscard]] std::size_t num_words() const noexcept {
        return data_.size();
    }

    /**
     * @brief Get the storage footprint in bytes.
     */
    [[nodiscard]] std::size_t size_bytes() const noexcept {
        return data_.size() * BYTES_PER_WORD;
    }

    /**
     * @brief Get value at index.
     *
     * @param index Slot index, must be below length()
     * @param[out] value Receives the value on success
     * @return Error::Ok or Error::IndexOutOfBounds
     */
    [[nodiscard]] Error try_get(std::size_t index, word_t& value) const noexcept {
        if (index >= length_) [[unlikely]]
            return Error::IndexOutOfBounds;
        value = get_unchecked(index);
        return Error::Ok;
    }

    /**
     * @brief Get value at index without bounds checking.
     *
     * @warning Caller must ensure index < length(). Undefined behavior otherwise.
     */
    [[nodiscard]] inline word_t get_unchecked(std::size_t index) const noexcept {
        return extract(data_.data(), locate(index, bit_width_), bit_width_);
    }

    /**
     * @brief Set value at index.
     *
     * Storage is left untouched when an error is returned.
     *
     * @param index Slot index, must be below length()
     * @param value New value, must not exceed max_value()
     * @return Error::Ok, Error::IndexOutOfBounds or Error::ValueOverflow
     */
    [[nodiscard]] Error try_set(std::size_t index, word_t value) noexcept {
        if (index >= length_) [[unlikely]]
            return Error::IndexOutOfBounds;
        if (value > max_value()) [[unlikely]]
            return Error::ValueOverflow;
        set_unchecked(index, value);
        return Error::Ok;
    }

    /**
     * @brief Set value at index without checks.
     *
     * @warning Caller must ensure index < length() and value <= max_value().
     */
    inline void set_unchecked(std::size_t index, word_t value) noexcept {
        deposit(data_.data(), locate(index, bit_width_), bit_width_, value);
    }

#if !BITLONGVEC_NO_EXCEPTIONS
    /**
     * @brief Get value at index.
     * @throws IndexOutOfBoundsException if index >= length()
     */
    [[nodiscard]] word_t get(std::size_t index) const {
        word_t value = 0;
        throw_on_error(try_get(index, value));
        return value;
    }

    /**
     * @brief Set value at index.
     * @throws IndexOutOfBoundsException if index >= length()
     * @throws ValueOverflowException if value > max_value()
     */
    void set(std::size_t index, word_t value) {
        throw_on_error(try_set(index, value));
    }

    /**
     * @brief Copy all values into a new vector with a different bit width.
     *
     * @throws InvalidBitWidthException if bit_width is 0 or greater than 64
     * @throws ValueOverflowException if a value does not fit the new width
     */
    [[nodiscard]] BitLongVec resize(std::size_t bit_width) const;
#endif

    /**
     * @brief Copy all values into a new vector with a different bit width.
     *
     * This vector is never modified.
     *
     * @param bit_width New bits per slot (1-64)
     * @param[out] out Receives the new vector on success, untouched on failure
     * @return Error::Ok, Error::InvalidBitWidth, Error::CapacityOverflow or
     *         Error::ValueOverflow
     */
    Error try_resize(std::size_t bit_width, BitLongVec& out) const;

    /**
     * @brief Get packed storage.
     */
    [[nodiscard]] const std::vector<word_t>& words() const noexcept {
        return data_;
    }

    /**
     * @brief Get raw data pointer (const only, slots must go through set).
     */
    [[nodiscard]] const word_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] bool operator==(const BitLongVec& other) const noexcept {
        return length_ == other.length_ && bit_width_ == other.bit_width_ &&
               data_ == other.data_;
    }

    [[nodiscard]] bool operator!=(const BitLongVec& other) const noexcept {
        return !(*this == other);
    }

private:
    BitLongVec(std::vector<word_t> words, std::size_t length, std::size_t bit_width) noexcept
        : data_(std::move(words)), length_(length), bit_width_(bit_width) {}

    static Error validate_shape(std::size_t length, std::size_t bit_width) noexcept;

    std::vector<word_t> data_;
    std::size_t length_;
    std::size_t bit_width_;
};

} // namespace bitlongvec

#endif // BITLONGVEC_BIT_LONG_VEC_HPP
