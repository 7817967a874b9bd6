#include "../include/row_set.hpp"

#include <utility>

#include "../include/logger.hpp"

namespace mapikit {

RowSet RowSet::adopt(RawRowSet*& raw, ForeignAllocator& allocator) {
  RowSet row_set(allocator);
  row_set.raw_ = std::exchange(raw, nullptr);
  return row_set;
}

RowSet::RowSet(RowSet&& other) noexcept
    : allocator_(other.allocator_),
      raw_(std::exchange(other.raw_, nullptr)) {}

RowSet& RowSet::operator=(RowSet&& other) noexcept {
  if (this != &other) {
    release();
    allocator_ = other.allocator_;
    raw_ = std::exchange(other.raw_, nullptr);
  }
  return *this;
}

RowSet::~RowSet() { release(); }

RawRowSet** RowSet::out_param() {
  release();
  return &raw_;
}

std::vector<Row> RowSet::take_rows() {
  std::vector<Row> rows;
  if (raw_ == nullptr) {
    return rows;
  }
  rows.reserve(raw_->row_count);
  for (uint32_t i = 0; i < raw_->row_count; ++i) {
    rows.push_back(Row::adopt(raw_->rows[i], *allocator_));
  }
  log_debug("took {} rows from row set {}", rows.size(),
            static_cast<void*>(raw_));
  return rows;
}

void RowSet::release() {
  RawRowSet* raw = std::exchange(raw_, nullptr);
  if (raw == nullptr) {
    return;
  }
  const ForeignStatus status = allocator_->free_row_set(raw);
  if (failed(status)) {
    log_error("free_row_set({}) failed: {}", static_cast<void*>(raw),
              foreign_status_name(status));
  }
}

}  // namespace mapikit
