#ifndef ALLOC_ERROR_HPP
#define ALLOC_ERROR_HPP

#include <arrow/status.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mapikit {

/**
 * Failure taxonomy of the arena. Every failed arena operation returns an
 * arrow::Status carrying an AllocErrorDetail with one of these codes.
 */
enum class AllocError {
  SIZE_OVERFLOW,         // byte count does not fit the foreign size parameter
  ALLOCATION_FAILED,     // foreign call failed, or succeeded with null
  OUT_OF_BOUNDS_ACCESS,  // typed view larger than the buffer
  ALREADY_INITIALIZED,   // commit/uninit/reinterpret on a Ready buffer
  NOT_YET_INITIALIZED    // typed access before commit
};

std::string to_string(AllocError error);

class AllocErrorDetail : public arrow::StatusDetail {
 public:
  static constexpr const char* TYPE_ID = "mapikit::AllocErrorDetail";

  explicit AllocErrorDetail(AllocError code, int32_t foreign_status = 0,
                            size_t requested_bytes = 0,
                            size_t capacity_bytes = 0)
      : code_(code),
        foreign_status_(foreign_status),
        requested_bytes_(requested_bytes),
        capacity_bytes_(capacity_bytes) {}

  const char* type_id() const override { return TYPE_ID; }
  std::string ToString() const override;

  AllocError code() const { return code_; }
  int32_t foreign_status() const { return foreign_status_; }
  size_t requested_bytes() const { return requested_bytes_; }
  size_t capacity_bytes() const { return capacity_bytes_; }

 private:
  AllocError code_;
  int32_t foreign_status_;
  size_t requested_bytes_;
  size_t capacity_bytes_;
};

arrow::Status size_overflow(size_t count, size_t element_size);
arrow::Status allocation_failed(int32_t foreign_status, size_t byte_count);
arrow::Status out_of_bounds_access(size_t count, size_t element_size,
                                   size_t capacity_bytes);
arrow::Status already_initialized();
arrow::Status not_yet_initialized();

/**
 * Recover the arena error code from a status, if it came from the arena.
 */
std::optional<AllocError> alloc_error_of(const arrow::Status& status);

/**
 * Full detail of an arena failure, or nullptr for statuses from elsewhere.
 */
std::shared_ptr<AllocErrorDetail> alloc_error_detail(
    const arrow::Status& status);

}  // namespace mapikit

#endif  // ALLOC_ERROR_HPP
