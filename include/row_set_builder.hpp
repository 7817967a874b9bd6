#ifndef ROW_SET_BUILDER_HPP
#define ROW_SET_BUILDER_HPP

#include <arrow/status.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <variant>
#include <vector>

#include "foreign_allocator.hpp"
#include "prop_tag.hpp"
#include "raw_types.hpp"

namespace mapikit {

template <typename T>
class ArenaBuffer;

/**
 * Values staged for one row. Every add_* call rewrites the tag's type code
 * to match the value it stores.
 */
class RowBuilder {
 public:
  RowBuilder& add_short(PropTag tag, int16_t value);
  RowBuilder& add_long(PropTag tag, int32_t value);
  RowBuilder& add_float(PropTag tag, float value);
  RowBuilder& add_double(PropTag tag, double value);
  RowBuilder& add_boolean(PropTag tag, bool value);
  // Fixed point, scaled by 10000
  RowBuilder& add_currency(PropTag tag, int64_t value);
  RowBuilder& add_app_time(PropTag tag, double value);
  RowBuilder& add_file_time(PropTag tag, FileTime value);
  RowBuilder& add_large_integer(PropTag tag, int64_t value);
  RowBuilder& add_ansi_string(PropTag tag, std::string value);
  RowBuilder& add_unicode_string(PropTag tag, std::u16string value);
  RowBuilder& add_binary(PropTag tag, std::vector<uint8_t> value);
  RowBuilder& add_guid(PropTag tag, const Guid& value);
  RowBuilder& add_long_array(PropTag tag, std::vector<int32_t> values);
  RowBuilder& add_error(PropTag tag, ForeignStatus status);
  RowBuilder& add_object(PropTag tag, int32_t value);

  /**
   * Copy a record verbatim, tag and pointers included. Pointers are not
   * followed or owned.
   */
  RowBuilder& add_raw(const RawPropValue& record);

  size_t size() const { return values_.size(); }

 private:
  friend class RowSetBuilder;

  using Payload =
      std::variant<std::monostate, std::string, std::u16string,
                   std::vector<uint8_t>, Guid, std::vector<int32_t>>;

  struct StagedValue {
    RawPropValue record;
    Payload payload;
  };

  RowBuilder& stage(PropTag tag, uint16_t type, const RawPropUnion& value,
                    Payload payload = std::monostate{});

  std::vector<StagedValue> values_;
};

/**
 * Produces a row set laid out the way the foreign API returns one, so
 * RowSet and Row can be driven without the native library.
 *
 * Allocation layout:
 *   - the outer array is its own root (released by free_row_set)
 *   - each row's record array is a root
 *   - strings, binaries, GUIDs and arrays are chained to their row's root
 *
 * Usage:
 *   RowSetBuilder builder(allocator);
 *   builder.add_row()
 *       .add_binary(tags::PR_INSTANCE_KEY, {1, 2, 3, 4})
 *       .add_unicode_string(tags::PR_SUBJECT_W, u"hello");
 *   RowSet rows(allocator);
 *   ARROW_RETURN_NOT_OK(builder.build(rows.out_param()));
 */
class RowSetBuilder {
 public:
  explicit RowSetBuilder(ForeignAllocator& allocator)
      : allocator_(&allocator) {}

  /**
   * Start a new row. The reference stays valid for the builder's lifetime.
   */
  RowBuilder& add_row();

  size_t size() const { return rows_.size(); }

  /**
   * Allocate and fill a row set from the staged rows.
   *
   * On failure every allocation made by this call is released and `*out` is
   * left null. The builder can be built again.
   */
  arrow::Status build(RawRowSet** out) const;

 private:
  // Chain the variable-length part of a staged value to the row's root and
  // point `record` at it
  static arrow::Status write_payload(const ArenaBuffer<RawPropValue>& records,
                                     const RowBuilder::Payload& payload,
                                     RawPropValue& record);

  ForeignAllocator* allocator_;
  std::deque<RowBuilder> rows_;
};

}  // namespace mapikit

#endif  // ROW_SET_BUILDER_HPP
