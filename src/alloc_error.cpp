#include "../include/alloc_error.hpp"

#include <string_view>

#include "../include/foreign_allocator.hpp"

namespace mapikit {

std::string to_string(const AllocError error) {
  switch (error) {
    case AllocError::SIZE_OVERFLOW:
      return "SizeOverflow";
    case AllocError::ALLOCATION_FAILED:
      return "AllocationFailed";
    case AllocError::OUT_OF_BOUNDS_ACCESS:
      return "OutOfBoundsAccess";
    case AllocError::ALREADY_INITIALIZED:
      return "AlreadyInitialized";
    case AllocError::NOT_YET_INITIALIZED:
      return "NotYetInitialized";
    default:
      return "Unknown";
  }
}

std::string AllocErrorDetail::ToString() const {
  std::string result = to_string(code_);
  switch (code_) {
    case AllocError::SIZE_OVERFLOW:
      result += " (requested " + std::to_string(requested_bytes_) + " bytes)";
      break;
    case AllocError::ALLOCATION_FAILED:
      result += " (" + foreign_status_name(foreign_status_) + ")";
      break;
    case AllocError::OUT_OF_BOUNDS_ACCESS:
      result += " (" + std::to_string(requested_bytes_) + " > " +
                std::to_string(capacity_bytes_) + " bytes)";
      break;
    default:
      break;
  }
  return result;
}

arrow::Status size_overflow(const size_t count, const size_t element_size) {
  const auto bytes = checked_byte_count(count, element_size);
  // Report SIZE_MAX when the product itself wrapped
  const size_t requested = bytes.value_or(SIZE_MAX);
  return arrow::Status::CapacityError("allocation of ", count, " x ",
                                      element_size,
                                      " bytes exceeds the foreign size limit")
      .WithDetail(std::make_shared<AllocErrorDetail>(
          AllocError::SIZE_OVERFLOW, 0, requested));
}

arrow::Status allocation_failed(const int32_t foreign_status,
                                const size_t byte_count) {
  return arrow::Status::OutOfMemory("foreign allocation of ", byte_count,
                                    " bytes failed: ",
                                    foreign_status_name(foreign_status))
      .WithDetail(std::make_shared<AllocErrorDetail>(
          AllocError::ALLOCATION_FAILED, foreign_status, byte_count));
}

arrow::Status out_of_bounds_access(const size_t count,
                                   const size_t element_size,
                                   const size_t capacity_bytes) {
  const size_t requested =
      checked_byte_count(count, element_size).value_or(SIZE_MAX);
  return arrow::Status::IndexError("access to ", count, " x ", element_size,
                                   " bytes exceeds buffer capacity of ",
                                   capacity_bytes)
      .WithDetail(std::make_shared<AllocErrorDetail>(
          AllocError::OUT_OF_BOUNDS_ACCESS, 0, requested, capacity_bytes));
}

arrow::Status already_initialized() {
  return arrow::Status::Invalid("buffer is already initialized")
      .WithDetail(
          std::make_shared<AllocErrorDetail>(AllocError::ALREADY_INITIALIZED));
}

arrow::Status not_yet_initialized() {
  return arrow::Status::Invalid("buffer is not yet initialized")
      .WithDetail(
          std::make_shared<AllocErrorDetail>(AllocError::NOT_YET_INITIALIZED));
}

std::shared_ptr<AllocErrorDetail> alloc_error_detail(
    const arrow::Status& status) {
  const auto& detail = status.detail();
  if (!detail ||
      std::string_view(detail->type_id()) != AllocErrorDetail::TYPE_ID) {
    return nullptr;
  }
  return std::static_pointer_cast<AllocErrorDetail>(detail);
}

std::optional<AllocError> alloc_error_of(const arrow::Status& status) {
  auto detail = alloc_error_detail(status);
  if (!detail) {
    return std::nullopt;
  }
  return detail->code();
}

}  // namespace mapikit
