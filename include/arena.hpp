#ifndef ARENA_HPP
#define ARENA_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <type_traits>

#include "alloc_error.hpp"
#include "foreign_allocator.hpp"

namespace mapikit {

/**
 * Initialization state of a foreign buffer. One-way: a buffer never goes back
 * to UNINITIALIZED.
 */
enum class BufferState { UNINITIALIZED, READY };

std::string to_string(BufferState state);

/**
 * Capability a chained node keeps on its root: enough to chain more blocks
 * and to name the handle the whole tree is freed against. Grants no
 * ownership.
 */
class AllocationRoot {
 public:
  virtual ~AllocationRoot() = default;

  virtual void* root_handle() const = 0;
  virtual ForeignAllocator* root_allocator() const = 0;
};

/**
 * One foreign allocation, untyped.
 *
 * A root node owns the allocation tree and issues exactly one free_buffer()
 * on destruction. A chained node only records where its memory came from;
 * destroying it never calls into the allocator, so it must not be used after
 * its root is gone.
 *
 * Nodes are heap-pinned (always held by unique_ptr) so that the root pointer
 * stored in chained nodes stays valid while the owning ArenaBuffer moves.
 */
class ArenaNode final : public AllocationRoot {
  // Restricts construction to allocate_root() and chain()
  struct Key {
    explicit Key() = default;
  };

 public:
  ArenaNode(Key, ForeignAllocator* allocator, void* handle, size_t byte_count,
            const AllocationRoot* root)
      : allocator_(allocator),
        handle_(handle),
        byte_count_(byte_count),
        root_(root) {}

  /**
   * Allocate `count * element_size` bytes as a new root.
   */
  static arrow::Result<std::unique_ptr<ArenaNode>> allocate_root(
      ForeignAllocator& allocator, size_t count, size_t element_size);

  /**
   * Allocate `count * element_size` bytes chained to the ultimate root of
   * this node's tree.
   */
  arrow::Result<std::unique_ptr<ArenaNode>> chain(size_t count,
                                                  size_t element_size) const;

  ~ArenaNode() override;

  ArenaNode(const ArenaNode&) = delete;
  ArenaNode& operator=(const ArenaNode&) = delete;
  ArenaNode(ArenaNode&&) = delete;
  ArenaNode& operator=(ArenaNode&&) = delete;

  void* root_handle() const override;
  ForeignAllocator* root_allocator() const override { return allocator_; }

  /**
   * OK if the node may change its element type (still UNINITIALIZED and
   * not detached).
   */
  arrow::Status check_reinterpretable() const;

  /**
   * Storage for `count` elements that have not been written yet.
   * Fails with ALREADY_INITIALIZED first, then OUT_OF_BOUNDS_ACCESS.
   */
  arrow::Result<void*> uninit(size_t count, size_t element_size);

  /**
   * Declare the first `count` elements written and move to READY.
   * Fails with OUT_OF_BOUNDS_ACCESS first, then ALREADY_INITIALIZED.
   *
   * The caller guarantees the memory really is fully initialized; this is the
   * only point where the arena takes the caller's word for it.
   */
  arrow::Result<void*> commit(size_t count, size_t element_size);

  /**
   * Typed access once READY.
   * Fails with NOT_YET_INITIALIZED first, then OUT_OF_BOUNDS_ACCESS.
   */
  arrow::Result<void*> access(size_t count, size_t element_size);

  /**
   * Give up the free responsibility of a root and return its handle; the
   * receiver frees it. Returns nullptr for chained nodes. Every later
   * accessor on a detached root fails with Invalid.
   */
  void* detach();

  bool is_root() const { return root_ == nullptr; }
  void* data() const { return handle_; }
  size_t byte_count() const { return byte_count_; }
  BufferState state() const { return state_; }

 private:
  arrow::Status check_attached() const;
  void release();

  ForeignAllocator* allocator_;
  void* handle_;
  size_t byte_count_;
  BufferState state_ = BufferState::UNINITIALIZED;
  const AllocationRoot* root_;  // nullptr for roots
};

/**
 * Typed view over a foreign allocation.
 *
 * Usage:
 *   HeapAllocator allocator;
 *   ARROW_ASSIGN_OR_RAISE(auto tags, ArenaBuffer<PropTagArray>::allocate(
 *                                        allocator));
 *   ARROW_ASSIGN_OR_RAISE(auto names, tags.chain<char>(64));
 *   ARROW_ASSIGN_OR_RAISE(PropTagArray* raw, tags.uninit());
 *   ... let the foreign API fill *raw ...
 *   ARROW_ASSIGN_OR_RAISE(PropTagArray* ready, tags.commit());
 *
 * `names` is freed together with `tags`, and must not outlive it.
 */
template <typename T>
class ArenaBuffer {
  static_assert(std::is_trivially_copyable_v<T>,
                "foreign buffers can only hold trivially copyable types");

 public:
  using element_type = T;

  /**
   * Allocate a root buffer with room for `count` elements of T.
   */
  static arrow::Result<ArenaBuffer> allocate(ForeignAllocator& allocator,
                                             size_t count = 1) {
    ARROW_ASSIGN_OR_RAISE(
        auto node, ArenaNode::allocate_root(allocator, count, sizeof(T)));
    return ArenaBuffer(std::move(node));
  }

  ArenaBuffer(ArenaBuffer&&) noexcept = default;
  ArenaBuffer& operator=(ArenaBuffer&&) noexcept = default;
  ArenaBuffer(const ArenaBuffer&) = delete;
  ArenaBuffer& operator=(const ArenaBuffer&) = delete;

  /**
   * Allocate a buffer for `count` elements of P that is released together
   * with this buffer's root.
   */
  template <typename P>
  arrow::Result<ArenaBuffer<P>> chain(size_t count = 1) const {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(auto node, node_->chain(count, sizeof(P)));
    return ArenaBuffer<P>(std::move(node));
  }

  /**
   * Change the element type of an UNINITIALIZED buffer. On success this
   * buffer is left empty; on failure it is untouched.
   */
  template <typename P>
  arrow::Result<ArenaBuffer<P>> reinterpret() {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_RETURN_NOT_OK(node_->check_reinterpretable());
    return ArenaBuffer<P>(std::move(node_));
  }

  arrow::Result<T*> uninit() {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->uninit(1, sizeof(T)));
    return static_cast<T*>(ptr);
  }

  arrow::Result<std::span<T>> uninit_slice(size_t count) {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->uninit(count, sizeof(T)));
    return std::span<T>(static_cast<T*>(ptr), count);
  }

  arrow::Result<T*> commit() {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->commit(1, sizeof(T)));
    return static_cast<T*>(ptr);
  }

  arrow::Result<std::span<T>> commit_slice(size_t count) {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->commit(count, sizeof(T)));
    return std::span<T>(static_cast<T*>(ptr), count);
  }

  arrow::Result<T*> as_mut() {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->access(1, sizeof(T)));
    return static_cast<T*>(ptr);
  }

  arrow::Result<std::span<T>> as_mut_slice(size_t count) {
    ARROW_RETURN_NOT_OK(check_node());
    ARROW_ASSIGN_OR_RAISE(void* ptr, node_->access(count, sizeof(T)));
    return std::span<T>(static_cast<T*>(ptr), count);
  }

  /**
   * Hand the root allocation to a consumer that frees it itself.
   * @return The root handle, or nullptr for chained or empty buffers
   */
  T* detach() { return node_ ? static_cast<T*>(node_->detach()) : nullptr; }

  bool empty() const { return node_ == nullptr; }
  bool is_root() const { return node_ && node_->is_root(); }
  size_t byte_count() const { return node_ ? node_->byte_count() : 0; }
  BufferState state() const {
    return node_ ? node_->state() : BufferState::UNINITIALIZED;
  }
  // Raw handle, regardless of state
  void* data() const { return node_ ? node_->data() : nullptr; }

 private:
  template <typename>
  friend class ArenaBuffer;

  explicit ArenaBuffer(std::unique_ptr<ArenaNode> node)
      : node_(std::move(node)) {}

  arrow::Status check_node() const {
    if (!node_) {
      return arrow::Status::Invalid("arena buffer is empty");
    }
    return arrow::Status::OK();
  }

  std::unique_ptr<ArenaNode> node_;
};

}  // namespace mapikit

#endif  // ARENA_HPP
