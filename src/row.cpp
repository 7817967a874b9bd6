#include "../include/row.hpp"

#include <utility>

#include "../include/logger.hpp"

namespace mapikit {

namespace {

const ContextLogger& rows_logger() {
  static const ContextLogger logger("rows");
  return logger;
}

}  // namespace

Row Row::adopt(RawRow& raw, ForeignAllocator& allocator) {
  const uint32_t count = std::exchange(raw.count, 0);
  RawPropValue* props = std::exchange(raw.props, nullptr);
  if (props != nullptr) {
    rows_logger().debug("adopted row {} ({} values)",
                        static_cast<void*>(props), count);
  }
  return Row(&allocator, count, props);
}

Row::Row(Row&& other) noexcept
    : allocator_(other.allocator_),
      count_(std::exchange(other.count_, 0)),
      props_(std::exchange(other.props_, nullptr)) {}

Row& Row::operator=(Row&& other) noexcept {
  if (this != &other) {
    release();
    allocator_ = other.allocator_;
    count_ = std::exchange(other.count_, 0);
    props_ = std::exchange(other.props_, nullptr);
  }
  return *this;
}

Row::~Row() { release(); }

void Row::release() {
  RawPropValue* props = std::exchange(props_, nullptr);
  count_ = 0;
  if (props == nullptr) {
    return;
  }
  const ForeignStatus status = allocator_->free_buffer(props);
  if (failed(status)) {
    rows_logger().error("free_buffer({}) for row failed: {}",
                        static_cast<void*>(props),
                        foreign_status_name(status));
  }
}

}  // namespace mapikit
