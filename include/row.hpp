#ifndef ROW_HPP
#define ROW_HPP

#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>

#include "foreign_allocator.hpp"
#include "prop_value.hpp"
#include "raw_types.hpp"

namespace mapikit {

/**
 * @brief Owned record array of one row.
 *
 * Adopting takes the array out of the raw row (the raw row is left with a
 * zero count and a null pointer), so the same raw row cannot be freed twice.
 * The destructor releases the array with a single free_buffer(), which also
 * releases every payload chained to it.
 */
class Row {
 public:
  /**
   * @brief Take ownership of `raw`'s record array.
   *
   * Adopting an already adopted raw row yields an empty Row that frees
   * nothing.
   */
  static Row adopt(RawRow& raw, ForeignAllocator& allocator);

  Row(Row&& other) noexcept;
  Row& operator=(Row&& other) noexcept;
  Row(const Row&) = delete;
  Row& operator=(const Row&) = delete;

  ~Row();

  size_t size() const { return props_ == nullptr ? 0 : count_; }
  bool empty() const { return size() == 0; }

  /**
   * @brief The records as laid out by the foreign API.
   */
  std::span<const RawPropValue> raw() const {
    return props_ == nullptr ? std::span<const RawPropValue>()
                             : std::span<const RawPropValue>(props_, count_);
  }

  /**
   * @brief Lazily decoded values, in record order.
   *
   * The range can be iterated any number of times; each pass decodes again.
   * Values borrow from this row and must not outlive it.
   */
  auto values() const {
    return raw() | std::views::transform(decode_prop_value);
  }

 private:
  Row(ForeignAllocator* allocator, uint32_t count, RawPropValue* props)
      : allocator_(allocator), count_(count), props_(props) {}

  void release();

  ForeignAllocator* allocator_;
  uint32_t count_;
  RawPropValue* props_;
};

}  // namespace mapikit

#endif  // ROW_HPP
