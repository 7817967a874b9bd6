#ifndef HEAP_ALLOCATOR_HPP
#define HEAP_ALLOCATOR_HPP

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "foreign_allocator.hpp"
#include "logger.hpp"

namespace mapikit {

/**
 * In-process implementation of the foreign allocator contract.
 *
 * Every root owns a list of chained blocks, and freeing the root drops the
 * whole list in one go, which is exactly the native semantics. Unlike the
 * native allocator it validates handles: chaining to or freeing an unknown
 * root fails with E_INVALIDARG instead of corrupting the heap, which makes
 * double frees observable in tests.
 *
 * Not thread-safe.
 */
class HeapAllocator : public ForeignAllocator {
 public:
  explicit HeapAllocator(
      HeapAllocatorConfig config = make_heap_config().build());

  ~HeapAllocator() override;

  // Buffers hold a pointer to their allocator, so it must stay put
  HeapAllocator(const HeapAllocator&) = delete;
  HeapAllocator& operator=(const HeapAllocator&) = delete;
  HeapAllocator(HeapAllocator&&) = delete;
  HeapAllocator& operator=(HeapAllocator&&) = delete;

  ForeignStatus allocate_buffer(ForeignSize byte_count, void** out) override;
  ForeignStatus allocate_more(ForeignSize byte_count, void* root,
                              void** out) override;
  ForeignStatus free_buffer(void* root) override;
  ForeignStatus free_row_set(RawRowSet* row_set) override;

  /**
   * True if `ptr` is a live root handle of this allocator.
   */
  [[nodiscard]] bool owns_root(const void* ptr) const;

  /**
   * Number of blocks chained to a live root (0 for unknown handles).
   */
  [[nodiscard]] size_t get_chained_count(const void* root) const;

  // Statistics
  size_t get_allocate_buffer_calls() const { return allocate_buffer_calls_; }
  size_t get_allocate_more_calls() const { return allocate_more_calls_; }
  size_t get_free_buffer_calls() const { return free_buffer_calls_; }
  size_t get_free_row_set_calls() const { return free_row_set_calls_; }
  size_t get_failed_free_calls() const { return failed_free_calls_; }
  size_t get_row_arrays_freed_by_row_set() const {
    return row_arrays_freed_by_row_set_;
  }
  size_t get_live_root_count() const { return trees_.size(); }
  size_t get_outstanding_bytes() const { return outstanding_bytes_; }

  const HeapAllocatorConfig& get_config() const { return config_; }

 private:
  struct Block {
    std::unique_ptr<std::byte[]> data;
    size_t size = 0;
  };

  // A root block and everything chained to it
  struct Tree {
    Block root;
    std::vector<Block> chained;
    size_t total_bytes = 0;
  };

  bool reserve(size_t byte_count);
  Block make_block(ForeignSize byte_count);
  void release_block(Block& block);
  ForeignStatus release_root(void* root, const char* caller);

  HeapAllocatorConfig config_;
  ContextLogger logger_;
  std::unordered_map<const void*, Tree> trees_;

  size_t outstanding_bytes_ = 0;
  size_t allocate_buffer_calls_ = 0;
  size_t allocate_more_calls_ = 0;
  size_t free_buffer_calls_ = 0;
  size_t free_row_set_calls_ = 0;
  size_t failed_free_calls_ = 0;
  size_t row_arrays_freed_by_row_set_ = 0;
};

}  // namespace mapikit

#endif  // HEAP_ALLOCATOR_HPP
