#include "../include/heap_allocator.hpp"

#include <algorithm>
#include <cstring>

#include "../include/raw_types.hpp"

namespace mapikit {

HeapAllocator::HeapAllocator(HeapAllocatorConfig config)
    : config_(config), logger_("heap") {}

HeapAllocator::~HeapAllocator() {
  if (!trees_.empty()) {
    logger_.warn("destroying allocator with {} live trees ({} bytes)",
                 trees_.size(), outstanding_bytes_);
  }
  for (auto& [handle, tree] : trees_) {
    release_block(tree.root);
    for (auto& block : tree.chained) {
      release_block(block);
    }
  }
  trees_.clear();
}

bool HeapAllocator::reserve(const size_t byte_count) {
  const size_t limit = config_.get_max_total_bytes();
  if (limit != 0 && outstanding_bytes_ + byte_count > limit) {
    logger_.warn("limit reached: {} outstanding + {} requested > {}",
                 outstanding_bytes_, byte_count, limit);
    return false;
  }
  return true;
}

HeapAllocator::Block HeapAllocator::make_block(const ForeignSize byte_count) {
  // Zero-byte requests still get a distinct, non-null address
  const size_t storage = std::max<size_t>(byte_count, 1);
  Block block{std::make_unique<std::byte[]>(storage), byte_count};
  if (config_.is_poison_on_allocate()) {
    std::memset(block.data.get(), config_.get_poison_byte(), storage);
  }
  outstanding_bytes_ += byte_count;
  return block;
}

void HeapAllocator::release_block(Block& block) {
  if (config_.is_poison_on_free() && block.data) {
    std::memset(block.data.get(), defaults::FREED_POISON_BYTE,
                std::max<size_t>(block.size, 1));
  }
  outstanding_bytes_ -= block.size;
  block.data.reset();
  block.size = 0;
}

ForeignStatus HeapAllocator::allocate_buffer(const ForeignSize byte_count,
                                             void** out) {
  ++allocate_buffer_calls_;
  if (out == nullptr) {
    return foreign_status::E_INVALIDARG;
  }
  *out = nullptr;
  if (!reserve(byte_count)) {
    return foreign_status::E_OUTOFMEMORY;
  }

  Tree tree;
  tree.root = make_block(byte_count);
  tree.total_bytes = byte_count;
  void* handle = tree.root.data.get();
  trees_.emplace(handle, std::move(tree));

  if (config_.is_trace_calls()) {
    logger_.debug("allocate_buffer({}) -> {}", byte_count, handle);
  }
  *out = handle;
  return foreign_status::S_OK;
}

ForeignStatus HeapAllocator::allocate_more(const ForeignSize byte_count,
                                           void* root, void** out) {
  ++allocate_more_calls_;
  if (out == nullptr) {
    return foreign_status::E_INVALIDARG;
  }
  *out = nullptr;

  auto it = trees_.find(root);
  if (it == trees_.end()) {
    logger_.error("allocate_more on unknown root {}", root);
    return foreign_status::E_INVALIDARG;
  }
  if (!reserve(byte_count)) {
    return foreign_status::E_OUTOFMEMORY;
  }

  Tree& tree = it->second;
  tree.chained.push_back(make_block(byte_count));
  tree.total_bytes += byte_count;
  void* handle = tree.chained.back().data.get();

  if (config_.is_trace_calls()) {
    logger_.debug("allocate_more({}, root={}) -> {} [{} chained]", byte_count,
                  root, handle, tree.chained.size());
  }
  *out = handle;
  return foreign_status::S_OK;
}

ForeignStatus HeapAllocator::release_root(void* root, const char* caller) {
  auto it = trees_.find(root);
  if (it == trees_.end()) {
    ++failed_free_calls_;
    logger_.error("{} on unknown or already freed root {}", caller, root);
    return foreign_status::E_INVALIDARG;
  }

  Tree& tree = it->second;
  if (config_.is_trace_calls()) {
    logger_.debug("{}({}) releases {} bytes in {} blocks", caller, root,
                  tree.total_bytes, tree.chained.size() + 1);
  }
  for (auto& block : tree.chained) {
    release_block(block);
  }
  release_block(tree.root);
  trees_.erase(it);
  return foreign_status::S_OK;
}

ForeignStatus HeapAllocator::free_buffer(void* root) {
  ++free_buffer_calls_;
  if (root == nullptr) {
    return foreign_status::S_OK;
  }
  return release_root(root, "free_buffer");
}

ForeignStatus HeapAllocator::free_row_set(RawRowSet* row_set) {
  ++free_row_set_calls_;
  if (row_set == nullptr) {
    return foreign_status::S_OK;
  }

  ForeignStatus result = foreign_status::S_OK;
  for (uint32_t i = 0; i < row_set->row_count; ++i) {
    RawRow& row = row_set->rows[i];
    if (row.props == nullptr) {
      continue;
    }
    const ForeignStatus status = release_root(row.props, "free_row_set");
    if (succeeded(status)) {
      ++row_arrays_freed_by_row_set_;
    } else {
      result = status;
    }
    row.props = nullptr;
    row.count = 0;
  }

  const ForeignStatus status = release_root(row_set, "free_row_set");
  return failed(result) ? result : status;
}

bool HeapAllocator::owns_root(const void* ptr) const {
  return trees_.contains(ptr);
}

size_t HeapAllocator::get_chained_count(const void* root) const {
  auto it = trees_.find(root);
  return it == trees_.end() ? 0 : it->second.chained.size();
}

}  // namespace mapikit
