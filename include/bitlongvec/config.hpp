/**
 * @file config.hpp
 * @brief bitlongvec compile-time configuration.
 *
 * Storage word type, version information and feature switches shared by
 * every other header of the library.
 */

#ifndef BITLONGVEC_CONFIG_HPP
#define BITLONGVEC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bitlongvec {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// 64-bit word type for packed storage
using word_t = std::uint64_t;
inline constexpr std::size_t BITS_PER_WORD = 64U;
inline constexpr std::size_t BYTES_PER_WORD = BITS_PER_WORD / 8U;

/// Widest value a slot can hold (one full storage word)
inline constexpr std::size_t MAX_BIT_WIDTH = BITS_PER_WORD;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITLONGVEC_NO_EXCEPTIONS=1 to disable exceptions. Only the
 * error-code API remains available in that mode.
 * @{
 */
#ifndef BITLONGVEC_NO_EXCEPTIONS
#define BITLONGVEC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitlongvec

#endif // BITLONGVEC_CONFIG_HPP
