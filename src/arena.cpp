#include "../include/arena.hpp"

#include <utility>

#include "../include/logger.hpp"
#include "../include/mem_utils.hpp"

namespace mapikit {

namespace {

const ContextLogger& arena_logger() {
  static const ContextLogger logger("arena");
  return logger;
}

/**
 * Size-check and issue one foreign allocation. A null `root` requests a new
 * root block, anything else chains to it.
 */
arrow::Result<void*> foreign_allocate(ForeignAllocator& allocator,
                                      const size_t count,
                                      const size_t element_size, void* root) {
  const auto byte_count = checked_byte_count(count, element_size);
  if (!byte_count) {
    return size_overflow(count, element_size);
  }
  const auto foreign_size = to_foreign_size(*byte_count);
  if (!foreign_size) {
    return size_overflow(count, element_size);
  }

  void* handle = nullptr;
  const ForeignStatus status =
      root == nullptr
          ? allocator.allocate_buffer(*foreign_size, &handle)
          : allocator.allocate_more(*foreign_size, root, &handle);
  if (failed(status)) {
    arena_logger().warn("foreign allocation of {} bytes failed: {}",
                        *byte_count, foreign_status_name(status));
    return allocation_failed(status, *byte_count);
  }
  if (handle == nullptr) {
    arena_logger().warn("foreign allocation of {} bytes returned null",
                        *byte_count);
    return allocation_failed(foreign_status::E_OUTOFMEMORY, *byte_count);
  }
  return handle;
}

}  // namespace

std::string to_string(const BufferState state) {
  switch (state) {
    case BufferState::UNINITIALIZED:
      return "Uninitialized";
    case BufferState::READY:
      return "Ready";
    default:
      return "Unknown";
  }
}

arrow::Result<std::unique_ptr<ArenaNode>> ArenaNode::allocate_root(
    ForeignAllocator& allocator, const size_t count,
    const size_t element_size) {
  ARROW_ASSIGN_OR_RAISE(
      void* handle, foreign_allocate(allocator, count, element_size, nullptr));
  const size_t byte_count = count * element_size;
  arena_logger().debug("root {} ({} bytes)", handle, byte_count);
  return std::make_unique<ArenaNode>(Key{}, &allocator, handle, byte_count,
                                     nullptr);
}

arrow::Result<std::unique_ptr<ArenaNode>> ArenaNode::chain(
    const size_t count, const size_t element_size) const {
  // Chaining always resolves to the top of the tree
  const AllocationRoot* root = is_root() ? this : root_;
  if (root->root_handle() == nullptr) {
    return arrow::Status::Invalid("cannot chain to a detached root");
  }
  ARROW_ASSIGN_OR_RAISE(
      void* handle, foreign_allocate(*root->root_allocator(), count,
                                     element_size, root->root_handle()));
  const size_t byte_count = count * element_size;
  arena_logger().debug("chained {} ({} bytes) to root {}", handle,
                       byte_count, root->root_handle());
  return std::make_unique<ArenaNode>(Key{}, root->root_allocator(), handle,
                                     byte_count, root);
}

ArenaNode::~ArenaNode() { release(); }

void* ArenaNode::root_handle() const {
  return is_root() ? handle_ : root_->root_handle();
}

void ArenaNode::release() {
  if (!is_root()) {
    return;
  }
  // Swap the handle out first so a second release is inert
  void* handle = std::exchange(handle_, nullptr);
  if (handle == nullptr) {
    return;
  }
  const ForeignStatus status = allocator_->free_buffer(handle);
  if (failed(status)) {
    arena_logger().error("free_buffer({}) failed: {}", handle,
                         foreign_status_name(status));
  }
}

void* ArenaNode::detach() {
  if (!is_root()) {
    return nullptr;
  }
  return std::exchange(handle_, nullptr);
}

arrow::Status ArenaNode::check_attached() const {
  if (handle_ == nullptr) {
    return arrow::Status::Invalid("arena buffer is detached");
  }
  return arrow::Status::OK();
}

arrow::Status ArenaNode::check_reinterpretable() const {
  ARROW_RETURN_NOT_OK(check_attached());
  if (state_ != BufferState::UNINITIALIZED) {
    return already_initialized();
  }
  return arrow::Status::OK();
}

arrow::Result<void*> ArenaNode::uninit(const size_t count,
                                       const size_t element_size) {
  ARROW_RETURN_NOT_OK(check_attached());
  if (state_ != BufferState::UNINITIALIZED) {
    return already_initialized();
  }
  if (!fits_in(count, element_size, byte_count_)) {
    return out_of_bounds_access(count, element_size, byte_count_);
  }
  return handle_;
}

arrow::Result<void*> ArenaNode::commit(const size_t count,
                                       const size_t element_size) {
  ARROW_RETURN_NOT_OK(check_attached());
  if (!fits_in(count, element_size, byte_count_)) {
    return out_of_bounds_access(count, element_size, byte_count_);
  }
  if (state_ != BufferState::UNINITIALIZED) {
    return already_initialized();
  }
  state_ = BufferState::READY;
  return handle_;
}

arrow::Result<void*> ArenaNode::access(const size_t count,
                                       const size_t element_size) {
  ARROW_RETURN_NOT_OK(check_attached());
  if (state_ != BufferState::READY) {
    return not_yet_initialized();
  }
  if (!fits_in(count, element_size, byte_count_)) {
    return out_of_bounds_access(count, element_size, byte_count_);
  }
  return handle_;
}

}  // namespace mapikit
