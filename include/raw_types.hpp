#ifndef RAW_TYPES_HPP
#define RAW_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace mapikit {

/**
 * C-layout records shared with the foreign API. Field order and widths follow
 * the native headers; nothing here owns memory.
 */

// 100ns intervals since 1601-01-01 UTC
struct FileTime {
  uint32_t low;
  uint32_t high;

  uint64_t ticks() const {
    return (static_cast<uint64_t>(high) << 32) | low;
  }
};

struct Guid {
  uint32_t data1;
  uint16_t data2;
  uint16_t data3;
  uint8_t data4[8];
};

// Fixed point, scaled by 10000
struct Currency {
  int64_t int64;
};

// UTF-16 code unit of the foreign wide-string type
using WideChar = char16_t;

struct RawBinary {
  uint32_t cb;
  uint8_t* lpb;
};

template <typename T>
struct RawMultiValue {
  uint32_t count;
  T* values;
};

union RawPropUnion {
  int16_t i;
  int32_t l;
  void* lpv;
  float flt;
  double dbl;
  uint16_t b;
  Currency cur;
  double at;
  FileTime ft;
  char* lpsz_a;
  RawBinary bin;
  WideChar* lpsz_w;
  Guid* lpguid;
  int64_t li;
  RawMultiValue<int16_t> mv_i;
  RawMultiValue<int32_t> mv_l;
  RawMultiValue<float> mv_flt;
  RawMultiValue<double> mv_dbl;
  RawMultiValue<Currency> mv_cur;
  RawMultiValue<double> mv_at;
  RawMultiValue<FileTime> mv_ft;
  RawMultiValue<RawBinary> mv_bin;
  RawMultiValue<char*> mv_sz_a;
  RawMultiValue<WideChar*> mv_sz_w;
  RawMultiValue<Guid> mv_guid;
  RawMultiValue<int64_t> mv_li;
  int32_t err;
  int32_t x;
};

struct RawPropValue {
  uint32_t prop_tag;
  uint32_t reserved;
  RawPropUnion value;
};

struct RawRow {
  uint32_t pad;
  uint32_t count;
  RawPropValue* props;
};

// Variable length: `rows` really holds `row_count` entries
struct RawRowSet {
  uint32_t row_count;
  RawRow rows[1];
};

/**
 * Byte size of a row set holding `row_count` rows.
 */
constexpr size_t row_set_byte_count(size_t row_count) {
  return offsetof(RawRowSet, rows) + row_count * sizeof(RawRow);
}

}  // namespace mapikit

#endif  // RAW_TYPES_HPP
