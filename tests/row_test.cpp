#include "../include/row.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <vector>

#include "../include/arena.hpp"
#include "../include/heap_allocator.hpp"
#include "../include/prop_tag.hpp"

using namespace mapikit;

class RowTest : public ::testing::Test {
 protected:
  void SetUp() override { heap = std::make_unique<HeapAllocator>(); }

  void TearDown() override {
    EXPECT_EQ(heap->get_live_root_count(), 0u);
    heap.reset();
  }

  // Record array allocated the way the foreign API hands one out
  RawPropValue* make_records(std::initializer_list<RawPropValue> records) {
    auto buffer =
        ArenaBuffer<RawPropValue>::allocate(*heap, records.size()).ValueOrDie();
    auto slots = buffer.uninit_slice(records.size()).ValueOrDie();
    std::copy(records.begin(), records.end(), slots.begin());
    EXPECT_TRUE(buffer.commit_slice(records.size()).ok());
    return buffer.detach();
  }

  static RawPropValue long_record(uint16_t prop_id, int32_t value) {
    RawPropValue record;
    std::memset(&record, 0, sizeof(record));
    record.prop_tag = PropTag(prop_id, prop_types::PT_LONG).value();
    record.value.l = value;
    return record;
  }

  static RawPropValue null_binary_record() {
    RawPropValue record;
    std::memset(&record, 0, sizeof(record));
    record.prop_tag = tags::PR_ENTRYID.value();
    record.value.bin.cb = 16;
    return record;
  }

  std::unique_ptr<HeapAllocator> heap;
};

TEST_F(RowTest, AdoptTakesOwnershipAndZeroesSource) {
  RawRow raw{0, 2, make_records({long_record(1, 10), long_record(2, 20)})};
  {
    Row row = Row::adopt(raw, *heap);
    EXPECT_EQ(row.size(), 2u);
    EXPECT_FALSE(row.empty());
    EXPECT_EQ(raw.count, 0u);
    EXPECT_EQ(raw.props, nullptr);

    // The zeroed source adopts into an empty row that frees nothing
    Row again = Row::adopt(raw, *heap);
    EXPECT_EQ(again.size(), 0u);
    EXPECT_TRUE(again.empty());
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
  EXPECT_EQ(heap->get_failed_free_calls(), 0u);
}

TEST_F(RowTest, ValuesAreDecodedInOrderAndRestartable) {
  RawRow raw{0, 3,
             make_records({long_record(1, 10), long_record(2, 20),
                           long_record(3, 30)})};
  Row row = Row::adopt(raw, *heap);

  std::vector<int32_t> first_pass;
  for (const PropValue& value : row.values()) {
    first_pass.push_back(value.as_long());
  }
  EXPECT_EQ(first_pass, (std::vector<int32_t>{10, 20, 30}));

  size_t second_pass = 0;
  for (const PropValue& value : row.values()) {
    EXPECT_EQ(value.tag().prop_id(), second_pass + 1);
    ++second_pass;
  }
  EXPECT_EQ(second_pass, 3u);
  EXPECT_EQ(row.raw().size(), 3u);
}

TEST_F(RowTest, NullPointerMeansEmpty) {
  RawRow raw{0, 5, nullptr};
  {
    Row row = Row::adopt(raw, *heap);
    EXPECT_EQ(row.size(), 0u);
    EXPECT_TRUE(row.empty());
    EXPECT_TRUE(row.raw().empty());
    size_t visited = 0;
    for (const PropValue& value : row.values()) {
      (void)value;
      ++visited;
    }
    EXPECT_EQ(visited, 0u);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 0u);
}

TEST_F(RowTest, NullBinaryPayloadDecodesAsPointerError) {
  RawRow raw{0, 2, make_records({long_record(1, 1), null_binary_record()})};
  Row row = Row::adopt(raw, *heap);

  std::vector<PropValue> values;
  for (const PropValue& value : row.values()) {
    values.push_back(value);
  }
  ASSERT_EQ(values.size(), 2u);
  EXPECT_EQ(values[0].as_long(), 1);
  EXPECT_EQ(values[1].kind(), PropKind::ERROR);
  EXPECT_EQ(values[1].as_error(), foreign_status::E_POINTER);
  EXPECT_EQ(values[1].tag(), tags::PR_ENTRYID);
}

TEST_F(RowTest, MoveTransfersTheSingleFree) {
  RawRow raw{0, 1, make_records({long_record(1, 1)})};
  {
    Row original = Row::adopt(raw, *heap);
    Row moved = std::move(original);
    EXPECT_EQ(moved.size(), 1u);
    EXPECT_TRUE(original.empty());

    RawRow other_raw{0, 1, make_records({long_record(2, 2)})};
    Row other = Row::adopt(other_raw, *heap);
    // Assignment releases the target's previous records first
    other = std::move(moved);
    EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
    EXPECT_EQ((*other.values().begin()).as_long(), 1);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 2u);
  EXPECT_EQ(heap->get_failed_free_calls(), 0u);
}

TEST_F(RowTest, FailedFreeIsReportedNotThrown) {
  RawPropValue foreign_records[1] = {long_record(1, 1)};
  RawRow raw{0, 1, foreign_records};
  {
    Row row = Row::adopt(raw, *heap);
    EXPECT_EQ(row.size(), 1u);
  }
  EXPECT_EQ(heap->get_free_buffer_calls(), 1u);
  EXPECT_EQ(heap->get_failed_free_calls(), 1u);
}
