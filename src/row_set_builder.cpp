#include "../include/row_set_builder.hpp"

#include <algorithm>
#include <cstring>
#include <span>

#include "../include/arena.hpp"
#include "../include/logger.hpp"

namespace mapikit {

namespace {

const ContextLogger& builder_logger() {
  static const ContextLogger logger("rows");
  return logger;
}

RawPropUnion zeroed_union() {
  RawPropUnion value;
  std::memset(&value, 0, sizeof(value));
  return value;
}

/**
 * Chain a copy of `source` (plus `terminators` zeroed elements) to the root
 * of `records` and return the committed storage.
 */
template <typename P>
arrow::Result<P*> chain_copy(const ArenaBuffer<RawPropValue>& records,
                             std::span<const P> source,
                             const size_t terminators = 0) {
  const size_t count = source.size() + terminators;
  ARROW_ASSIGN_OR_RAISE(auto buffer, records.chain<P>(count));
  ARROW_ASSIGN_OR_RAISE(std::span<P> slots, buffer.uninit_slice(count));
  std::copy(source.begin(), source.end(), slots.begin());
  std::fill(slots.begin() + source.size(), slots.end(), P{});
  ARROW_ASSIGN_OR_RAISE(std::span<P> ready, buffer.commit_slice(count));
  return ready.data();
}

}  // namespace

RowBuilder& RowBuilder::stage(const PropTag tag, const uint16_t type,
                              const RawPropUnion& value, Payload payload) {
  StagedValue staged;
  std::memset(&staged.record, 0, sizeof(staged.record));
  staged.record.prop_tag = tag.with_type(type).value();
  staged.record.value = value;
  staged.payload = std::move(payload);
  values_.push_back(std::move(staged));
  return *this;
}

RowBuilder& RowBuilder::add_short(const PropTag tag, const int16_t value) {
  RawPropUnion u = zeroed_union();
  u.i = value;
  return stage(tag, prop_types::PT_SHORT, u);
}

RowBuilder& RowBuilder::add_long(const PropTag tag, const int32_t value) {
  RawPropUnion u = zeroed_union();
  u.l = value;
  return stage(tag, prop_types::PT_LONG, u);
}

RowBuilder& RowBuilder::add_float(const PropTag tag, const float value) {
  RawPropUnion u = zeroed_union();
  u.flt = value;
  return stage(tag, prop_types::PT_FLOAT, u);
}

RowBuilder& RowBuilder::add_double(const PropTag tag, const double value) {
  RawPropUnion u = zeroed_union();
  u.dbl = value;
  return stage(tag, prop_types::PT_DOUBLE, u);
}

RowBuilder& RowBuilder::add_boolean(const PropTag tag, const bool value) {
  RawPropUnion u = zeroed_union();
  u.b = value ? 1 : 0;
  return stage(tag, prop_types::PT_BOOLEAN, u);
}

RowBuilder& RowBuilder::add_currency(const PropTag tag, const int64_t value) {
  RawPropUnion u = zeroed_union();
  u.cur.int64 = value;
  return stage(tag, prop_types::PT_CURRENCY, u);
}

RowBuilder& RowBuilder::add_app_time(const PropTag tag, const double value) {
  RawPropUnion u = zeroed_union();
  u.at = value;
  return stage(tag, prop_types::PT_APPTIME, u);
}

RowBuilder& RowBuilder::add_file_time(const PropTag tag,
                                      const FileTime value) {
  RawPropUnion u = zeroed_union();
  u.ft = value;
  return stage(tag, prop_types::PT_SYSTIME, u);
}

RowBuilder& RowBuilder::add_large_integer(const PropTag tag,
                                          const int64_t value) {
  RawPropUnion u = zeroed_union();
  u.li = value;
  return stage(tag, prop_types::PT_LONGLONG, u);
}

RowBuilder& RowBuilder::add_ansi_string(const PropTag tag,
                                        std::string value) {
  return stage(tag, prop_types::PT_STRING8, zeroed_union(), std::move(value));
}

RowBuilder& RowBuilder::add_unicode_string(const PropTag tag,
                                           std::u16string value) {
  return stage(tag, prop_types::PT_UNICODE, zeroed_union(), std::move(value));
}

RowBuilder& RowBuilder::add_binary(const PropTag tag,
                                   std::vector<uint8_t> value) {
  return stage(tag, prop_types::PT_BINARY, zeroed_union(), std::move(value));
}

RowBuilder& RowBuilder::add_guid(const PropTag tag, const Guid& value) {
  return stage(tag, prop_types::PT_CLSID, zeroed_union(), value);
}

RowBuilder& RowBuilder::add_long_array(const PropTag tag,
                                       std::vector<int32_t> values) {
  return stage(tag, prop_types::PT_MV_LONG, zeroed_union(), std::move(values));
}

RowBuilder& RowBuilder::add_error(const PropTag tag,
                                  const ForeignStatus status) {
  RawPropUnion u = zeroed_union();
  u.err = status;
  return stage(tag, prop_types::PT_ERROR, u);
}

RowBuilder& RowBuilder::add_object(const PropTag tag, const int32_t value) {
  RawPropUnion u = zeroed_union();
  u.x = value;
  return stage(tag, prop_types::PT_OBJECT, u);
}

RowBuilder& RowBuilder::add_raw(const RawPropValue& record) {
  values_.push_back(StagedValue{record, std::monostate{}});
  return *this;
}

arrow::Status RowSetBuilder::write_payload(
    const ArenaBuffer<RawPropValue>& records,
    const RowBuilder::Payload& payload, RawPropValue& record) {
  if (const auto* str = std::get_if<std::string>(&payload)) {
    ARROW_ASSIGN_OR_RAISE(
        record.value.lpsz_a,
        chain_copy(records, std::span<const char>(*str), 1));
  } else if (const auto* wstr = std::get_if<std::u16string>(&payload)) {
    ARROW_ASSIGN_OR_RAISE(
        record.value.lpsz_w,
        chain_copy(records, std::span<const WideChar>(*wstr), 1));
  } else if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&payload)) {
    ARROW_ASSIGN_OR_RAISE(
        record.value.bin.lpb,
        chain_copy(records, std::span<const uint8_t>(*bytes)));
    record.value.bin.cb = static_cast<uint32_t>(bytes->size());
  } else if (const auto* guid = std::get_if<Guid>(&payload)) {
    ARROW_ASSIGN_OR_RAISE(record.value.lpguid,
                          chain_copy(records, std::span<const Guid>(guid, 1)));
  } else if (const auto* longs = std::get_if<std::vector<int32_t>>(&payload)) {
    ARROW_ASSIGN_OR_RAISE(
        record.value.mv_l.values,
        chain_copy(records, std::span<const int32_t>(*longs)));
    record.value.mv_l.count = static_cast<uint32_t>(longs->size());
  }
  return arrow::Status::OK();
}

RowBuilder& RowSetBuilder::add_row() { return rows_.emplace_back(); }

arrow::Status RowSetBuilder::build(RawRowSet** out) const {
  if (out == nullptr) {
    return arrow::Status::Invalid("row set out-parameter is null");
  }
  *out = nullptr;

  // Everything stays owned by these buffers until the last allocation has
  // succeeded; an early return releases it all.
  std::vector<ArenaBuffer<RawPropValue>> row_buffers;
  row_buffers.reserve(rows_.size());
  for (const RowBuilder& row : rows_) {
    ARROW_ASSIGN_OR_RAISE(
        auto records,
        ArenaBuffer<RawPropValue>::allocate(*allocator_, row.size()));
    ARROW_ASSIGN_OR_RAISE(std::span<RawPropValue> slots,
                          records.uninit_slice(row.size()));
    for (size_t i = 0; i < row.size(); ++i) {
      const RowBuilder::StagedValue& staged = row.values_[i];
      RawPropValue record = staged.record;
      ARROW_RETURN_NOT_OK(write_payload(records, staged.payload, record));
      slots[i] = record;
    }
    ARROW_RETURN_NOT_OK(records.commit_slice(row.size()).status());
    row_buffers.push_back(std::move(records));
  }

  const size_t outer_bytes = row_set_byte_count(rows_.size());
  ARROW_ASSIGN_OR_RAISE(
      auto outer, ArenaBuffer<std::byte>::allocate(*allocator_, outer_bytes));
  ARROW_ASSIGN_OR_RAISE(std::span<std::byte> storage,
                        outer.uninit_slice(outer_bytes));
  std::memset(storage.data(), 0, storage.size());
  auto* row_set = reinterpret_cast<RawRowSet*>(storage.data());
  row_set->row_count = static_cast<uint32_t>(rows_.size());
  for (size_t i = 0; i < row_buffers.size(); ++i) {
    row_set->rows[i].count = static_cast<uint32_t>(rows_[i].size());
    row_set->rows[i].props = static_cast<RawPropValue*>(row_buffers[i].data());
  }
  ARROW_RETURN_NOT_OK(outer.commit_slice(outer_bytes).status());

  // Ownership moves to the caller, who frees it with free_row_set()
  for (auto& records : row_buffers) {
    records.detach();
  }
  *out = reinterpret_cast<RawRowSet*>(outer.detach());
  builder_logger().debug("built row set {} ({} rows, {} bytes)",
                         static_cast<void*>(*out), rows_.size(), outer_bytes);
  return arrow::Status::OK();
}

}  // namespace mapikit
