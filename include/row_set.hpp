#ifndef ROW_SET_HPP
#define ROW_SET_HPP

#include <cstddef>
#include <vector>

#include "foreign_allocator.hpp"
#include "raw_types.hpp"
#include "row.hpp"

namespace mapikit {

/**
 * @brief Owned outer array of a row set.
 *
 * The outer array and the per-row record arrays are released by different
 * foreign calls: rows taken with take_rows() free their own records, and the
 * destructor hands whatever is left to free_row_set(), which skips rows whose
 * record pointer was already nulled by adoption.
 *
 * Usage:
 *   RowSet rows(allocator);
 *   table->query_rows(rows.out_param());
 *   for (Row& row : rows.take_rows()) {
 *     for (const PropValue& value : row.values()) { ... }
 *   }
 */
class RowSet {
 public:
  explicit RowSet(ForeignAllocator& allocator) : allocator_(&allocator) {}

  /**
   * @brief Take ownership of `raw` and null the caller's pointer.
   */
  static RowSet adopt(RawRowSet*& raw, ForeignAllocator& allocator);

  RowSet(RowSet&& other) noexcept;
  RowSet& operator=(RowSet&& other) noexcept;
  RowSet(const RowSet&) = delete;
  RowSet& operator=(const RowSet&) = delete;

  ~RowSet();

  /**
   * @brief Slot for a producer that writes a `RawRowSet*`. Any row set held
   * before is released first.
   */
  RawRowSet** out_param();

  size_t size() const { return raw_ == nullptr ? 0 : raw_->row_count; }
  bool empty() const { return size() == 0; }

  const RawRowSet* raw() const { return raw_; }

  /**
   * @brief Adopt every raw row into an owned Row.
   *
   * The outer array stays with this RowSet. Calling it again yields rows
   * that are all empty.
   */
  std::vector<Row> take_rows();

 private:
  void release();

  ForeignAllocator* allocator_;
  RawRowSet* raw_ = nullptr;
};

}  // namespace mapikit

#endif  // ROW_SET_HPP
