#ifndef PROP_VALUE_HPP
#define PROP_VALUE_HPP

#include <arrow/result.h>
#include <arrow/scalar.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <variant>

#include "foreign_allocator.hpp"
#include "prop_tag.hpp"
#include "raw_types.hpp"

namespace mapikit {

/**
 * Which member of the raw value union a decoded property carries.
 */
enum class PropKind {
  SHORT,                // PT_SHORT
  LONG,                 // PT_LONG
  POINTER,              // PT_PTR
  FLOAT,                // PT_FLOAT
  DOUBLE,               // PT_DOUBLE
  BOOLEAN,              // PT_BOOLEAN
  CURRENCY,             // PT_CURRENCY
  APP_TIME,             // PT_APPTIME
  FILE_TIME,            // PT_SYSTIME
  ANSI_STRING,          // PT_STRING8
  BINARY,               // PT_BINARY
  UNICODE_STRING,       // PT_UNICODE
  GUID,                 // PT_CLSID
  LARGE_INTEGER,        // PT_LONGLONG
  SHORT_ARRAY,          // PT_MV_SHORT
  LONG_ARRAY,           // PT_MV_LONG
  FLOAT_ARRAY,          // PT_MV_FLOAT
  DOUBLE_ARRAY,         // PT_MV_DOUBLE
  CURRENCY_ARRAY,       // PT_MV_CURRENCY
  APP_TIME_ARRAY,       // PT_MV_APPTIME
  FILE_TIME_ARRAY,      // PT_MV_SYSTIME
  BINARY_ARRAY,         // PT_MV_BINARY
  ANSI_STRING_ARRAY,    // PT_MV_STRING8
  UNICODE_STRING_ARRAY, // PT_MV_UNICODE
  GUID_ARRAY,           // PT_MV_CLSID
  LARGE_INTEGER_ARRAY,  // PT_MV_LONGLONG
  ERROR,                // PT_ERROR, or a payload that could not be decoded
  OBJECT                // PT_NULL or PT_OBJECT
};

std::string to_string(PropKind kind);

/**
 * Safe view of one raw property record.
 *
 * Pointer and array payloads borrow from the record's storage (usually a
 * row's record array and the blocks chained to it), so a PropValue must not
 * outlive the Row it came from.
 */
class PropValue {
 public:
  using Data =
      std::variant<int16_t, int32_t, int64_t, uint16_t, float, double, void*,
                   FileTime, const char*, const WideChar*, const Guid*,
                   std::span<const uint8_t>, std::span<const int16_t>,
                   std::span<const int32_t>, std::span<const float>,
                   std::span<const double>, std::span<const Currency>,
                   std::span<const FileTime>, std::span<const RawBinary>,
                   std::span<char* const>, std::span<WideChar* const>,
                   std::span<const Guid>, std::span<const int64_t>>;

  PropValue(PropTag tag, PropKind kind, Data data)
      : tag_(tag), kind_(kind), data_(std::move(data)) {}

  /**
   * Error variant carrying a foreign status code.
   */
  static PropValue error(PropTag tag, ForeignStatus status) {
    return PropValue(tag, PropKind::ERROR, Data{std::in_place_type<int32_t>,
                                                status});
  }

  PropTag tag() const { return tag_; }
  PropKind kind() const { return kind_; }
  const Data& data() const { return data_; }

  bool is_error() const { return kind_ == PropKind::ERROR; }

  template <typename T>
  const T& get() const {
    return std::get<T>(data_);
  }

  // Accessors throw std::bad_variant_access when the stored type differs.
  // Kinds sharing a storage type (DOUBLE and APP_TIME, CURRENCY and
  // LARGE_INTEGER, LONG, ERROR and OBJECT) are told apart by kind() only.
  [[nodiscard]] int16_t as_short() const { return get<int16_t>(); }
  [[nodiscard]] int32_t as_long() const { return get<int32_t>(); }
  [[nodiscard]] void* as_pointer() const { return get<void*>(); }
  [[nodiscard]] float as_float() const { return get<float>(); }
  [[nodiscard]] double as_double() const { return get<double>(); }
  [[nodiscard]] bool as_boolean() const { return get<uint16_t>() != 0; }
  [[nodiscard]] int64_t as_currency() const { return get<int64_t>(); }
  [[nodiscard]] double as_app_time() const { return get<double>(); }
  [[nodiscard]] FileTime as_file_time() const { return get<FileTime>(); }
  [[nodiscard]] const char* as_ansi_string() const {
    return get<const char*>();
  }
  [[nodiscard]] const WideChar* as_unicode_string() const {
    return get<const WideChar*>();
  }
  [[nodiscard]] std::span<const uint8_t> as_binary() const {
    return get<std::span<const uint8_t>>();
  }
  [[nodiscard]] const Guid& as_guid() const { return *get<const Guid*>(); }
  [[nodiscard]] int64_t as_large_integer() const { return get<int64_t>(); }
  [[nodiscard]] std::span<const int16_t> as_short_array() const {
    return get<std::span<const int16_t>>();
  }
  [[nodiscard]] std::span<const int32_t> as_long_array() const {
    return get<std::span<const int32_t>>();
  }
  [[nodiscard]] std::span<const float> as_float_array() const {
    return get<std::span<const float>>();
  }
  [[nodiscard]] std::span<const double> as_double_array() const {
    return get<std::span<const double>>();
  }
  [[nodiscard]] std::span<const Currency> as_currency_array() const {
    return get<std::span<const Currency>>();
  }
  [[nodiscard]] std::span<const double> as_app_time_array() const {
    return get<std::span<const double>>();
  }
  [[nodiscard]] std::span<const FileTime> as_file_time_array() const {
    return get<std::span<const FileTime>>();
  }
  [[nodiscard]] std::span<const RawBinary> as_binary_array() const {
    return get<std::span<const RawBinary>>();
  }
  [[nodiscard]] std::span<char* const> as_ansi_string_array() const {
    return get<std::span<char* const>>();
  }
  [[nodiscard]] std::span<WideChar* const> as_unicode_string_array() const {
    return get<std::span<WideChar* const>>();
  }
  [[nodiscard]] std::span<const Guid> as_guid_array() const {
    return get<std::span<const Guid>>();
  }
  [[nodiscard]] std::span<const int64_t> as_large_integer_array() const {
    return get<std::span<const int64_t>>();
  }
  [[nodiscard]] ForeignStatus as_error() const { return get<int32_t>(); }
  [[nodiscard]] int32_t as_object() const { return get<int32_t>(); }

  /**
   * Readable rendering for logs, e.g. "0x0037001F Unicode=Hello".
   */
  std::string to_string() const;

  /**
   * Convert a single-valued payload to an Arrow scalar. Strings are copied;
   * wide strings are transcoded to UTF-8; file times become nanosecond UTC
   * timestamps. Multi-valued, pointer, GUID and object payloads are not
   * supported.
   */
  arrow::Result<std::shared_ptr<arrow::Scalar>> as_scalar() const;

 private:
  PropTag tag_;
  PropKind kind_;
  Data data_;
};

/**
 * Decode a raw record according to its type code.
 *
 * Total: the instance flag is ignored, null pointer/array payloads become
 * ERROR(E_POINTER), and unknown type codes become ERROR(E_INVALIDARG).
 */
PropValue decode_prop_value(const RawPropValue& raw);

/**
 * Transcode a null-terminated UTF-16 string to UTF-8. Unpaired surrogates
 * are replaced with U+FFFD.
 */
std::string utf16_to_utf8(const WideChar* str);

/**
 * Unix epoch nanoseconds for a FileTime.
 * CapacityError outside 1677-09-21 .. 2262-04-11, where int64 nanoseconds
 * run out.
 */
arrow::Result<int64_t> file_time_to_unix_nanos(FileTime time);

}  // namespace mapikit

#endif  // PROP_VALUE_HPP
