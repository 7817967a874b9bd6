#ifndef MEM_UTILS_HPP
#define MEM_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace mapikit {

/**
 * Size parameter type of the foreign allocator. Narrower than size_t on
 * 64-bit hosts, so every conversion into it has to be checked.
 */
using ForeignSize = uint32_t;

constexpr size_t MAX_FOREIGN_SIZE = std::numeric_limits<ForeignSize>::max();

/**
 * Multiply an element count by an element size without wrapping.
 *
 * @return The byte count, or std::nullopt if it does not fit in size_t
 */
constexpr std::optional<size_t> checked_byte_count(size_t count,
                                                   size_t element_size) {
  if (element_size != 0 &&
      count > std::numeric_limits<size_t>::max() / element_size) {
    return std::nullopt;
  }
  return count * element_size;
}

/**
 * Narrow a host byte count to the foreign allocator's size parameter.
 */
constexpr std::optional<ForeignSize> to_foreign_size(size_t byte_count) {
  if (byte_count > MAX_FOREIGN_SIZE) {
    return std::nullopt;
  }
  return static_cast<ForeignSize>(byte_count);
}

/**
 * True if `count` elements of `element_size` bytes fit in `capacity` bytes.
 * An overflowing request never fits.
 */
constexpr bool fits_in(size_t count, size_t element_size, size_t capacity) {
  const auto bytes = checked_byte_count(count, element_size);
  return bytes.has_value() && *bytes <= capacity;
}

}  // namespace mapikit

#endif  // MEM_UTILS_HPP
