#include "../include/row_set.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../include/heap_allocator.hpp"
#include "../include/prop_tag.hpp"
#include "../include/row_set_builder.hpp"

using namespace mapikit;

class RowSetTest : public ::testing::Test {
 protected:
  void SetUp() override {
    heap = std::make_unique<HeapAllocator>();
    builder = std::make_unique<RowSetBuilder>(*heap);
    for (int32_t i = 0; i < 3; ++i) {
      builder->add_row()
          .add_long(tags::PR_MESSAGE_SIZE, 100 * (i + 1))
          .add_unicode_string(tags::PR_SUBJECT_W,
                              u"message " + std::u16string(1, u'A' + i));
    }
  }

  void TearDown() override {
    EXPECT_EQ(heap->get_live_root_count(), 0u);
    EXPECT_EQ(heap->get_outstanding_bytes(), 0u);
    EXPECT_EQ(heap->get_failed_free_calls(), 0u);
    builder.reset();
    heap.reset();
  }

  std::unique_ptr<HeapAllocator> heap;
  std::unique_ptr<RowSetBuilder> builder;
};

TEST_F(RowSetTest, EmptyRowSetFreesNothing) {
  {
    RowSet rows(*heap);
    EXPECT_EQ(rows.size(), 0u);
    EXPECT_TRUE(rows.empty());
    EXPECT_TRUE(rows.take_rows().empty());
  }
  EXPECT_EQ(heap->get_free_row_set_calls(), 0u);
}

TEST_F(RowSetTest, AdoptNullsTheSource) {
  RawRowSet* raw = nullptr;
  ASSERT_TRUE(builder->build(&raw).ok());
  ASSERT_NE(raw, nullptr);
  {
    RowSet rows = RowSet::adopt(raw, *heap);
    EXPECT_EQ(raw, nullptr);
    EXPECT_EQ(rows.size(), 3u);
    EXPECT_FALSE(rows.empty());
  }
  EXPECT_EQ(heap->get_free_row_set_calls(), 1u);
}

TEST_F(RowSetTest, TakenRowsFreeTheirOwnRecords) {
  {
    RowSet rows(*heap);
    ASSERT_TRUE(builder->build(rows.out_param()).ok());

    std::vector<Row> taken = rows.take_rows();
    ASSERT_EQ(taken.size(), 3u);
    for (size_t i = 0; i < taken.size(); ++i) {
      EXPECT_EQ(taken[i].size(), 2u);
      EXPECT_EQ((*taken[i].values().begin()).as_long(),
                static_cast<int32_t>(100 * (i + 1)));
    }
  }
  // One free per row, then the outer array alone
  EXPECT_EQ(heap->get_free_buffer_calls(), 3u);
  EXPECT_EQ(heap->get_free_row_set_calls(), 1u);
  EXPECT_EQ(heap->get_row_arrays_freed_by_row_set(), 0u);
}

TEST_F(RowSetTest, UntakenRowsAreFreedByTheRowSet) {
  {
    RowSet rows(*heap);
    ASSERT_TRUE(builder->build(rows.out_param()).ok());
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 0u);
  EXPECT_EQ(heap->get_free_row_set_calls(), 1u);
  EXPECT_EQ(heap->get_row_arrays_freed_by_row_set(), 3u);
}

TEST_F(RowSetTest, SecondTakeYieldsEmptyRows) {
  RowSet rows(*heap);
  ASSERT_TRUE(builder->build(rows.out_param()).ok());

  auto first = rows.take_rows();
  auto second = rows.take_rows();
  ASSERT_EQ(second.size(), 3u);
  for (const Row& row : second) {
    EXPECT_TRUE(row.empty());
  }
  EXPECT_EQ(rows.size(), 3u);
}

TEST_F(RowSetTest, RowsOutliveTheirRowSet) {
  std::vector<Row> taken;
  {
    RowSet rows(*heap);
    ASSERT_TRUE(builder->build(rows.out_param()).ok());
    taken = rows.take_rows();
  }
  EXPECT_EQ(heap->get_free_row_set_calls(), 1u);

  std::vector<std::string> subjects;
  for (const Row& row : taken) {
    for (const PropValue& value : row.values()) {
      if (value.kind() == PropKind::UNICODE_STRING) {
        subjects.push_back(utf16_to_utf8(value.as_unicode_string()));
      }
    }
  }
  EXPECT_EQ(subjects, (std::vector<std::string>{"message A", "message B",
                                                "message C"}));
}

TEST_F(RowSetTest, OutParamReleasesPreviousSet) {
  RowSet rows(*heap);
  ASSERT_TRUE(builder->build(rows.out_param()).ok());
  ASSERT_TRUE(builder->build(rows.out_param()).ok());
  EXPECT_EQ(heap->get_free_row_set_calls(), 1u);
  EXPECT_EQ(rows.size(), 3u);
}

TEST_F(RowSetTest, MoveKeepsSingleRelease) {
  {
    RowSet rows(*heap);
    ASSERT_TRUE(builder->build(rows.out_param()).ok());
    RowSet moved = std::move(rows);
    EXPECT_TRUE(rows.empty());
    EXPECT_EQ(moved.size(), 3u);

    RowSet target(*heap);
    ASSERT_TRUE(builder->build(target.out_param()).ok());
    target = std::move(moved);
    EXPECT_EQ(heap->get_free_row_set_calls(), 1u);
  }
  EXPECT_EQ(heap->get_free_row_set_calls(), 2u);
}
