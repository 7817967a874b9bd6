#ifndef OUT_PARAM_HPP
#define OUT_PARAM_HPP

#include <cstddef>
#include <span>
#include <utility>

#include "foreign_allocator.hpp"
#include "logger.hpp"

namespace mapikit {

/**
 * Owner of a pointer the foreign API returns through a `T**` out-parameter
 * and that must later be released with free_buffer().
 *
 * Usage:
 *   OutParam<PropTagArray> columns(allocator);
 *   ARROW_RETURN_NOT_OK(check(table->query_columns(columns.out())));
 *   for (uint32_t tag : columns.span(columns.get()->count)) { ... }
 */
template <typename T>
class OutParam {
 public:
  explicit OutParam(ForeignAllocator& allocator) : allocator_(&allocator) {}

  OutParam(OutParam&& other) noexcept
      : allocator_(other.allocator_), ptr_(std::exchange(other.ptr_, nullptr)) {}

  OutParam& operator=(OutParam&& other) noexcept {
    if (this != &other) {
      reset();
      allocator_ = other.allocator_;
      ptr_ = std::exchange(other.ptr_, nullptr);
    }
    return *this;
  }

  OutParam(const OutParam&) = delete;
  OutParam& operator=(const OutParam&) = delete;

  ~OutParam() { reset(); }

  /**
   * Slot to pass to the foreign API. Releases the current pointer, if any.
   */
  T** out() {
    reset();
    return &ptr_;
  }

  T* get() const { return ptr_; }

  /**
   * View `count` elements at the held pointer; empty while nothing is held.
   */
  std::span<T> span(size_t count) const {
    return ptr_ == nullptr ? std::span<T>() : std::span<T>(ptr_, count);
  }

  /**
   * Give up ownership; the caller frees the returned pointer.
   */
  T* release() { return std::exchange(ptr_, nullptr); }

  void reset() {
    T* ptr = std::exchange(ptr_, nullptr);
    if (ptr == nullptr) {
      return;
    }
    void* handle = const_cast<void*>(static_cast<const void*>(ptr));
    const ForeignStatus status = allocator_->free_buffer(handle);
    if (failed(status)) {
      log_error("free_buffer({}) for out-param failed: {}", handle,
                foreign_status_name(status));
    }
  }

 private:
  ForeignAllocator* allocator_;
  T* ptr_ = nullptr;
};

}  // namespace mapikit

#endif  // OUT_PARAM_HPP
