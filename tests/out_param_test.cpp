#include "../include/out_param.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <span>

#include "../include/arena.hpp"
#include "../include/heap_allocator.hpp"
#include "../include/prop_tag.hpp"

using namespace mapikit;

namespace {

// Stand-in for a foreign call that returns a tag list it allocated
ForeignStatus query_columns(ForeignAllocator& allocator, PropTagArray** out) {
  auto buffer = ArenaBuffer<SizedPropTagArray<2>>::allocate(allocator);
  if (!buffer.ok()) {
    return foreign_status::E_OUTOFMEMORY;
  }
  SizedPropTagArray<2>* columns = buffer->uninit().ValueOrDie();
  columns->count = 2;
  columns->tags[0] = tags::PR_INSTANCE_KEY.value();
  columns->tags[1] = tags::PR_SUBJECT_W.value();
  if (!buffer->commit().ok()) {
    return foreign_status::E_FAIL;
  }
  *out = reinterpret_cast<PropTagArray*>(buffer->detach());
  return foreign_status::S_OK;
}

}  // namespace

class OutParamTest : public ::testing::Test {
 protected:
  void SetUp() override { heap = std::make_unique<HeapAllocator>(); }

  void TearDown() override {
    EXPECT_EQ(heap->get_live_root_count(), 0u);
    EXPECT_EQ(heap->get_failed_free_calls(), 0u);
    heap.reset();
  }

  std::unique_ptr<HeapAllocator> heap;
};

TEST_F(OutParamTest, EmptyHolderFreesNothing) {
  {
    OutParam<PropTagArray> columns(*heap);
    EXPECT_EQ(columns.get(), nullptr);
    EXPECT_TRUE(columns.span(4).empty());
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 0u);
}

TEST_F(OutParamTest, FreesWhatTheCalleeAllocated) {
  {
    OutParam<PropTagArray> columns(*heap);
    ASSERT_EQ(query_columns(*heap, columns.out()), foreign_status::S_OK);
    ASSERT_NE(columns.get(), nullptr);
    EXPECT_EQ(columns.get()->count, 2u);

    auto tag_values = std::span<const uint32_t>(columns.get()->tags,
                                                columns.get()->count);
    EXPECT_EQ(tag_values[1], tags::PR_SUBJECT_W.value());
    EXPECT_EQ(columns.span(1).size(), 1u);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
}

TEST_F(OutParamTest, ReuseReleasesPreviousValue) {
  OutParam<PropTagArray> columns(*heap);
  ASSERT_EQ(query_columns(*heap, columns.out()), foreign_status::S_OK);
  PropTagArray* first = columns.get();
  ASSERT_EQ(query_columns(*heap, columns.out()), foreign_status::S_OK);

  EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
  EXPECT_FALSE(heap->owns_root(first));
  EXPECT_TRUE(heap->owns_root(columns.get()));
}

TEST_F(OutParamTest, ReleaseHandsOwnershipBack) {
  PropTagArray* released = nullptr;
  {
    OutParam<PropTagArray> columns(*heap);
    ASSERT_EQ(query_columns(*heap, columns.out()), foreign_status::S_OK);
    released = columns.release();
    EXPECT_EQ(columns.get(), nullptr);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 0u);
  EXPECT_EQ(heap->free_buffer(released), foreign_status::S_OK);
}

TEST_F(OutParamTest, MoveKeepsSingleFree) {
  {
    OutParam<PropTagArray> columns(*heap);
    ASSERT_EQ(query_columns(*heap, columns.out()), foreign_status::S_OK);
    OutParam<PropTagArray> moved = std::move(columns);
    EXPECT_EQ(columns.get(), nullptr);
    EXPECT_NE(moved.get(), nullptr);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
}
