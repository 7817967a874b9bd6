#ifndef FOREIGN_ALLOCATOR_HPP
#define FOREIGN_ALLOCATOR_HPP

#include <cstdint>
#include <string>

#include "mem_utils.hpp"

namespace mapikit {

struct RawRowSet;

/**
 * HRESULT-style status returned by the foreign API. Negative values are
 * failures.
 */
using ForeignStatus = int32_t;

namespace foreign_status {
constexpr ForeignStatus S_OK = 0;
constexpr ForeignStatus E_POINTER = static_cast<int32_t>(0x80004003);
constexpr ForeignStatus E_INVALIDARG = static_cast<int32_t>(0x80070057);
constexpr ForeignStatus E_OUTOFMEMORY = static_cast<int32_t>(0x8007000E);
constexpr ForeignStatus E_FAIL = static_cast<int32_t>(0x80004005);
}  // namespace foreign_status

constexpr bool succeeded(ForeignStatus status) { return status >= 0; }
constexpr bool failed(ForeignStatus status) { return status < 0; }

std::string foreign_status_name(ForeignStatus status);

/**
 * Contract of the allocator that owns every buffer crossing the foreign
 * boundary.
 *
 * Allocations form trees: allocate_buffer() creates a root, allocate_more()
 * links a new block to an existing root, and a single free_buffer() on the
 * root releases the root and every block chained to it. Freeing a chained
 * block directly, or freeing a root twice, is undefined on the native side.
 *
 * Implementations are not required to be thread-safe.
 */
class ForeignAllocator {
 public:
  virtual ~ForeignAllocator() = default;

  /**
   * Allocate a new root block.
   * @param byte_count Size of the block in bytes
   * @param out Receives the block; left null on failure
   */
  virtual ForeignStatus allocate_buffer(ForeignSize byte_count,
                                        void** out) = 0;

  /**
   * Allocate a block whose lifetime is tied to `root`.
   * @param root Handle previously returned by allocate_buffer()
   */
  virtual ForeignStatus allocate_more(ForeignSize byte_count, void* root,
                                      void** out) = 0;

  /**
   * Release a root block together with every block chained to it.
   */
  virtual ForeignStatus free_buffer(void* root) = 0;

  /**
   * Release a row set: each row's record array that is still attached, then
   * the outer row array itself.
   */
  virtual ForeignStatus free_row_set(RawRowSet* row_set) = 0;
};

}  // namespace mapikit

#endif  // FOREIGN_ALLOCATOR_HPP
