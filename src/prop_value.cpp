#include "../include/prop_value.hpp"

#include <arrow/buffer.h>
#include <arrow/type.h>
#include <arrow/util/decimal.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace mapikit {

namespace {

// Elements rendered per array in to_string()
constexpr size_t MAX_RENDERED_ELEMENTS = 8;
// Bytes rendered per binary payload in to_string()
constexpr size_t MAX_RENDERED_BYTES = 32;

// 100ns ticks between 1601-01-01 and 1970-01-01
constexpr int64_t FILE_TIME_UNIX_EPOCH = 116444736000000000LL;

template <typename T>
PropValue make_value(PropTag tag, PropKind kind, T value) {
  return PropValue(tag, kind, PropValue::Data{std::in_place_type<T>, value});
}

template <typename T>
PropValue make_array(PropTag tag, PropKind kind, const RawMultiValue<T>& mv) {
  if (mv.values == nullptr) {
    return PropValue::error(tag, foreign_status::E_POINTER);
  }
  return make_value(tag, kind, std::span<const T>(mv.values, mv.count));
}

template <typename T>
PropValue make_pointer(PropTag tag, PropKind kind, T* ptr) {
  if (ptr == nullptr) {
    return PropValue::error(tag, foreign_status::E_POINTER);
  }
  return make_value(tag, kind, static_cast<const T*>(ptr));
}

std::string render_guid(const Guid& guid) {
  return spdlog::fmt_lib::format(
      "{{{:08X}-{:04X}-{:04X}-{:02X}{:02X}-{:02X}{:02X}{:02X}{:02X}{:02X}{:02X}"
      "}}",
      guid.data1, guid.data2, guid.data3, guid.data4[0], guid.data4[1],
      guid.data4[2], guid.data4[3], guid.data4[4], guid.data4[5],
      guid.data4[6], guid.data4[7]);
}

std::string render_bytes(const uint8_t* bytes, size_t size) {
  std::string result;
  const size_t shown = std::min(size, MAX_RENDERED_BYTES);
  for (size_t i = 0; i < shown; ++i) {
    result += spdlog::fmt_lib::format("{:02X}", bytes[i]);
  }
  if (shown < size) {
    result += "...";
  }
  return result;
}

template <typename T, typename Render>
std::string render_array(std::span<const T> values, Render render) {
  std::string result = "[" + std::to_string(values.size()) + "]={";
  const size_t shown = std::min(values.size(), MAX_RENDERED_ELEMENTS);
  for (size_t i = 0; i < shown; ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += render(values[i]);
  }
  if (shown < values.size()) {
    result += ", ...";
  }
  return result + "}";
}

std::string render_ansi(const char* str) {
  return str == nullptr ? "(null)" : "\"" + std::string(str) + "\"";
}

std::string render_unicode(const WideChar* str) {
  return str == nullptr ? "(null)" : "\"" + utf16_to_utf8(str) + "\"";
}

void append_utf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

}  // namespace

std::string to_string(const PropKind kind) {
  switch (kind) {
    case PropKind::SHORT:
      return "Short";
    case PropKind::LONG:
      return "Long";
    case PropKind::POINTER:
      return "Pointer";
    case PropKind::FLOAT:
      return "Float";
    case PropKind::DOUBLE:
      return "Double";
    case PropKind::BOOLEAN:
      return "Boolean";
    case PropKind::CURRENCY:
      return "Currency";
    case PropKind::APP_TIME:
      return "AppTime";
    case PropKind::FILE_TIME:
      return "FileTime";
    case PropKind::ANSI_STRING:
      return "AnsiString";
    case PropKind::BINARY:
      return "Binary";
    case PropKind::UNICODE_STRING:
      return "Unicode";
    case PropKind::GUID:
      return "Guid";
    case PropKind::LARGE_INTEGER:
      return "LargeInteger";
    case PropKind::SHORT_ARRAY:
      return "ShortArray";
    case PropKind::LONG_ARRAY:
      return "LongArray";
    case PropKind::FLOAT_ARRAY:
      return "FloatArray";
    case PropKind::DOUBLE_ARRAY:
      return "DoubleArray";
    case PropKind::CURRENCY_ARRAY:
      return "CurrencyArray";
    case PropKind::APP_TIME_ARRAY:
      return "AppTimeArray";
    case PropKind::FILE_TIME_ARRAY:
      return "FileTimeArray";
    case PropKind::BINARY_ARRAY:
      return "BinaryArray";
    case PropKind::ANSI_STRING_ARRAY:
      return "AnsiStringArray";
    case PropKind::UNICODE_STRING_ARRAY:
      return "UnicodeArray";
    case PropKind::GUID_ARRAY:
      return "GuidArray";
    case PropKind::LARGE_INTEGER_ARRAY:
      return "LargeIntegerArray";
    case PropKind::ERROR:
      return "Error";
    case PropKind::OBJECT:
      return "Object";
    default:
      return "Unknown";
  }
}

PropValue decode_prop_value(const RawPropValue& raw) {
  using namespace prop_types;

  const PropTag tag(raw.prop_tag);
  const RawPropUnion& v = raw.value;

  switch (tag.base_type()) {
    case PT_SHORT:
      return make_value(tag, PropKind::SHORT, v.i);
    case PT_LONG:
      return make_value(tag, PropKind::LONG, v.l);
    case PT_PTR:
      return make_value(tag, PropKind::POINTER, v.lpv);
    case PT_FLOAT:
      return make_value(tag, PropKind::FLOAT, v.flt);
    case PT_DOUBLE:
      return make_value(tag, PropKind::DOUBLE, v.dbl);
    case PT_BOOLEAN:
      return make_value(tag, PropKind::BOOLEAN, v.b);
    case PT_CURRENCY:
      return make_value(tag, PropKind::CURRENCY, v.cur.int64);
    case PT_APPTIME:
      return make_value(tag, PropKind::APP_TIME, v.at);
    case PT_SYSTIME:
      return make_value(tag, PropKind::FILE_TIME, v.ft);
    case PT_STRING8:
      return make_pointer(tag, PropKind::ANSI_STRING, v.lpsz_a);
    case PT_BINARY:
      if (v.bin.lpb == nullptr) {
        return PropValue::error(tag, foreign_status::E_POINTER);
      }
      return make_value(tag, PropKind::BINARY,
                        std::span<const uint8_t>(v.bin.lpb, v.bin.cb));
    case PT_UNICODE:
      return make_pointer(tag, PropKind::UNICODE_STRING, v.lpsz_w);
    case PT_CLSID:
      return make_pointer(tag, PropKind::GUID, v.lpguid);
    case PT_LONGLONG:
      return make_value(tag, PropKind::LARGE_INTEGER, v.li);
    case PT_MV_SHORT:
      return make_array(tag, PropKind::SHORT_ARRAY, v.mv_i);
    case PT_MV_LONG:
      return make_array(tag, PropKind::LONG_ARRAY, v.mv_l);
    case PT_MV_FLOAT:
      return make_array(tag, PropKind::FLOAT_ARRAY, v.mv_flt);
    case PT_MV_DOUBLE:
      return make_array(tag, PropKind::DOUBLE_ARRAY, v.mv_dbl);
    case PT_MV_CURRENCY:
      return make_array(tag, PropKind::CURRENCY_ARRAY, v.mv_cur);
    case PT_MV_APPTIME:
      return make_array(tag, PropKind::APP_TIME_ARRAY, v.mv_at);
    case PT_MV_SYSTIME:
      return make_array(tag, PropKind::FILE_TIME_ARRAY, v.mv_ft);
    case PT_MV_BINARY:
      return make_array(tag, PropKind::BINARY_ARRAY, v.mv_bin);
    case PT_MV_STRING8:
      return make_array(tag, PropKind::ANSI_STRING_ARRAY, v.mv_sz_a);
    case PT_MV_UNICODE:
      return make_array(tag, PropKind::UNICODE_STRING_ARRAY, v.mv_sz_w);
    case PT_MV_CLSID:
      return make_array(tag, PropKind::GUID_ARRAY, v.mv_guid);
    case PT_MV_LONGLONG:
      return make_array(tag, PropKind::LARGE_INTEGER_ARRAY, v.mv_li);
    case PT_ERROR:
      return PropValue::error(tag, v.err);
    case PT_NULL:
    case PT_OBJECT:
      return make_value(tag, PropKind::OBJECT, v.x);
    default:
      return PropValue::error(tag, foreign_status::E_INVALIDARG);
  }
}

std::string PropValue::to_string() const {
  std::string value;
  switch (kind_) {
    case PropKind::SHORT:
      value = std::to_string(as_short());
      break;
    case PropKind::LONG:
      value = std::to_string(as_long());
      break;
    case PropKind::POINTER:
      value = spdlog::fmt_lib::format("{}", as_pointer());
      break;
    case PropKind::FLOAT:
      value = spdlog::fmt_lib::format("{}", as_float());
      break;
    case PropKind::DOUBLE:
    case PropKind::APP_TIME:
      value = spdlog::fmt_lib::format("{}", as_double());
      break;
    case PropKind::BOOLEAN:
      value = as_boolean() ? "true" : "false";
      break;
    case PropKind::CURRENCY: {
      const int64_t scaled = as_currency();
      const uint64_t magnitude = scaled < 0
                                     ? uint64_t{0} - static_cast<uint64_t>(scaled)
                                     : static_cast<uint64_t>(scaled);
      value = spdlog::fmt_lib::format("{}{}.{:04}", scaled < 0 ? "-" : "",
                                      magnitude / 10000, magnitude % 10000);
      break;
    }
    case PropKind::FILE_TIME:
      value = std::to_string(as_file_time().ticks());
      break;
    case PropKind::ANSI_STRING:
      value = render_ansi(as_ansi_string());
      break;
    case PropKind::BINARY:
      value = "[" + std::to_string(as_binary().size()) + "]=" +
              render_bytes(as_binary().data(), as_binary().size());
      break;
    case PropKind::UNICODE_STRING:
      value = render_unicode(as_unicode_string());
      break;
    case PropKind::GUID:
      value = render_guid(as_guid());
      break;
    case PropKind::LARGE_INTEGER:
      value = std::to_string(as_large_integer());
      break;
    case PropKind::SHORT_ARRAY:
      value = render_array(as_short_array(),
                           [](int16_t x) { return std::to_string(x); });
      break;
    case PropKind::LONG_ARRAY:
      value = render_array(as_long_array(),
                           [](int32_t x) { return std::to_string(x); });
      break;
    case PropKind::FLOAT_ARRAY:
      value = render_array(as_float_array(), [](float x) {
        return spdlog::fmt_lib::format("{}", x);
      });
      break;
    case PropKind::DOUBLE_ARRAY:
    case PropKind::APP_TIME_ARRAY:
      value = render_array(as_double_array(), [](double x) {
        return spdlog::fmt_lib::format("{}", x);
      });
      break;
    case PropKind::CURRENCY_ARRAY:
      value = render_array(as_currency_array(), [](const Currency& x) {
        return std::to_string(x.int64);
      });
      break;
    case PropKind::FILE_TIME_ARRAY:
      value = render_array(as_file_time_array(), [](const FileTime& x) {
        return std::to_string(x.ticks());
      });
      break;
    case PropKind::BINARY_ARRAY:
      value = render_array(as_binary_array(), [](const RawBinary& x) {
        return x.lpb == nullptr ? std::string("(null)")
                                : render_bytes(x.lpb, x.cb);
      });
      break;
    case PropKind::ANSI_STRING_ARRAY:
      value = render_array(as_ansi_string_array(), render_ansi);
      break;
    case PropKind::UNICODE_STRING_ARRAY:
      value = render_array(as_unicode_string_array(), render_unicode);
      break;
    case PropKind::GUID_ARRAY:
      value = render_array(as_guid_array(), render_guid);
      break;
    case PropKind::LARGE_INTEGER_ARRAY:
      value = render_array(as_large_integer_array(),
                           [](int64_t x) { return std::to_string(x); });
      break;
    case PropKind::ERROR:
      value = foreign_status_name(as_error());
      break;
    case PropKind::OBJECT:
      value = std::to_string(as_object());
      break;
  }
  return tag_.to_string() + " " + mapikit::to_string(kind_) + "=" + value;
}

arrow::Result<std::shared_ptr<arrow::Scalar>> PropValue::as_scalar() const {
  switch (kind_) {
    case PropKind::SHORT:
      return arrow::MakeScalar(as_short());
    case PropKind::LONG:
      return arrow::MakeScalar(as_long());
    case PropKind::FLOAT:
      return arrow::MakeScalar(as_float());
    case PropKind::DOUBLE:
    case PropKind::APP_TIME:
      return arrow::MakeScalar(as_double());
    case PropKind::BOOLEAN:
      return arrow::MakeScalar(as_boolean());
    case PropKind::LARGE_INTEGER:
      return arrow::MakeScalar(as_large_integer());
    case PropKind::CURRENCY:
      return std::make_shared<arrow::Decimal128Scalar>(
          arrow::Decimal128(as_currency()), arrow::decimal128(19, 4));
    case PropKind::FILE_TIME: {
      ARROW_ASSIGN_OR_RAISE(int64_t nanos,
                            file_time_to_unix_nanos(as_file_time()));
      return std::make_shared<arrow::TimestampScalar>(
          nanos, arrow::timestamp(arrow::TimeUnit::NANO, "UTC"));
    }
    case PropKind::ANSI_STRING:
      return arrow::MakeScalar(std::string(as_ansi_string()));
    case PropKind::UNICODE_STRING:
      return arrow::MakeScalar(utf16_to_utf8(as_unicode_string()));
    case PropKind::BINARY: {
      const auto bytes = as_binary();
      return std::make_shared<arrow::BinaryScalar>(arrow::Buffer::FromString(
          std::string(reinterpret_cast<const char*>(bytes.data()),
                      bytes.size())));
    }
    case PropKind::ERROR:
    case PropKind::OBJECT:
      return arrow::MakeNullScalar(arrow::null());
    default:
      return arrow::Status::NotImplemented(
          "Unsupported property kind for Arrow scalar conversion: ",
          mapikit::to_string(kind_));
  }
}

std::string utf16_to_utf8(const WideChar* str) {
  std::string result;
  if (str == nullptr) {
    return result;
  }
  for (const WideChar* p = str; *p != 0; ++p) {
    const uint32_t unit = *p;
    if (unit >= 0xD800 && unit <= 0xDBFF) {
      const uint32_t next = *(p + 1);
      if (next >= 0xDC00 && next <= 0xDFFF) {
        append_utf8(result,
                    0x10000 + ((unit - 0xD800) << 10) + (next - 0xDC00));
        ++p;
        continue;
      }
      append_utf8(result, 0xFFFD);
    } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
      append_utf8(result, 0xFFFD);
    } else {
      append_utf8(result, unit);
    }
  }
  return result;
}

arrow::Result<int64_t> file_time_to_unix_nanos(const FileTime time) {
  constexpr int64_t max_nanos = std::numeric_limits<int64_t>::max();
  constexpr int64_t min_nanos = std::numeric_limits<int64_t>::min();
  const uint64_t ticks = time.ticks();
  if (ticks > static_cast<uint64_t>(max_nanos)) {
    return arrow::Status::CapacityError("file time ", ticks,
                                        " is out of timestamp range");
  }
  const int64_t since_epoch =
      static_cast<int64_t>(ticks) - FILE_TIME_UNIX_EPOCH;
  if (since_epoch > max_nanos / 100 || since_epoch < min_nanos / 100) {
    return arrow::Status::CapacityError("file time ", ticks,
                                        " is out of timestamp range");
  }
  return since_epoch * 100;
}

}  // namespace mapikit
