#ifndef PROP_TAG_HPP
#define PROP_TAG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace mapikit {

/**
 * Property type codes (low 16 bits of a tag).
 */
namespace prop_types {
constexpr uint16_t PT_UNSPECIFIED = 0x0000;
constexpr uint16_t PT_NULL = 0x0001;
constexpr uint16_t PT_SHORT = 0x0002;
constexpr uint16_t PT_LONG = 0x0003;
constexpr uint16_t PT_FLOAT = 0x0004;
constexpr uint16_t PT_DOUBLE = 0x0005;
constexpr uint16_t PT_CURRENCY = 0x0006;
constexpr uint16_t PT_APPTIME = 0x0007;
constexpr uint16_t PT_ERROR = 0x000A;
constexpr uint16_t PT_BOOLEAN = 0x000B;
constexpr uint16_t PT_OBJECT = 0x000D;
constexpr uint16_t PT_LONGLONG = 0x0014;
constexpr uint16_t PT_STRING8 = 0x001E;
constexpr uint16_t PT_UNICODE = 0x001F;
constexpr uint16_t PT_SYSTIME = 0x0040;
constexpr uint16_t PT_CLSID = 0x0048;
constexpr uint16_t PT_BINARY = 0x0102;
constexpr uint16_t PT_PTR = 0x0103;

// Multi-value flag and the per-instance flag used by table rows
constexpr uint16_t MV_FLAG = 0x1000;
constexpr uint16_t MV_INSTANCE = 0x2000;

constexpr uint16_t PT_MV_SHORT = MV_FLAG | PT_SHORT;
constexpr uint16_t PT_MV_LONG = MV_FLAG | PT_LONG;
constexpr uint16_t PT_MV_FLOAT = MV_FLAG | PT_FLOAT;
constexpr uint16_t PT_MV_DOUBLE = MV_FLAG | PT_DOUBLE;
constexpr uint16_t PT_MV_CURRENCY = MV_FLAG | PT_CURRENCY;
constexpr uint16_t PT_MV_APPTIME = MV_FLAG | PT_APPTIME;
constexpr uint16_t PT_MV_LONGLONG = MV_FLAG | PT_LONGLONG;
constexpr uint16_t PT_MV_STRING8 = MV_FLAG | PT_STRING8;
constexpr uint16_t PT_MV_UNICODE = MV_FLAG | PT_UNICODE;
constexpr uint16_t PT_MV_SYSTIME = MV_FLAG | PT_SYSTIME;
constexpr uint16_t PT_MV_CLSID = MV_FLAG | PT_CLSID;
constexpr uint16_t PT_MV_BINARY = MV_FLAG | PT_BINARY;
}  // namespace prop_types

/**
 * 32-bit property tag: identifier in the high half, type code in the low
 * half.
 */
class PropTag {
 public:
  constexpr PropTag() : value_(0) {}
  constexpr explicit PropTag(uint32_t value) : value_(value) {}
  constexpr PropTag(uint16_t prop_id, uint16_t prop_type)
      : value_((static_cast<uint32_t>(prop_id) << 16) | prop_type) {}

  constexpr uint16_t prop_id() const {
    return static_cast<uint16_t>((value_ & 0xFFFF0000u) >> 16);
  }
  constexpr uint16_t prop_type() const {
    return static_cast<uint16_t>(value_ & 0xFFFFu);
  }

  // Type code with the instance flag masked off
  constexpr uint16_t base_type() const {
    return prop_type() & static_cast<uint16_t>(~prop_types::MV_INSTANCE);
  }

  constexpr bool is_multi_value() const {
    return (prop_type() & prop_types::MV_FLAG) != 0;
  }

  constexpr bool is_instance() const {
    return (prop_type() & prop_types::MV_INSTANCE) != 0;
  }

  // Same identifier, different type
  constexpr PropTag with_type(uint16_t type) const {
    return PropTag(prop_id(), type);
  }

  constexpr uint32_t value() const { return value_; }

  constexpr bool operator==(const PropTag& other) const = default;

  std::string to_string() const;

 private:
  uint32_t value_;
};

/**
 * A handful of well-known tags. The full tag space belongs to the caller.
 */
namespace tags {
constexpr PropTag PR_NULL{0x0000, prop_types::PT_NULL};
constexpr PropTag PR_SUBJECT_W{0x0037, prop_types::PT_UNICODE};
constexpr PropTag PR_MESSAGE_DELIVERY_TIME{0x0E06, prop_types::PT_SYSTIME};
constexpr PropTag PR_ENTRYID{0x0FFF, prop_types::PT_BINARY};
constexpr PropTag PR_INSTANCE_KEY{0x0FF6, prop_types::PT_BINARY};
constexpr PropTag PR_DISPLAY_NAME_W{0x3001, prop_types::PT_UNICODE};
constexpr PropTag PR_DISPLAY_NAME_A{0x3001, prop_types::PT_STRING8};
constexpr PropTag PR_MESSAGE_SIZE{0x0E08, prop_types::PT_LONG};
}  // namespace tags

/**
 * Counted tag list as the foreign API expects it. `tags` really holds
 * `count` entries; use prop_tag_array_byte_count() to size allocations.
 */
struct PropTagArray {
  uint32_t count;
  uint32_t tags[1];
};

constexpr size_t prop_tag_array_byte_count(size_t count) {
  return offsetof(PropTagArray, tags) + count * sizeof(uint32_t);
}

/**
 * Same layout as PropTagArray with room for exactly N tags.
 */
template <size_t N>
struct SizedPropTagArray {
  uint32_t count;
  uint32_t tags[N];
};

}  // namespace mapikit

#endif  // PROP_TAG_HPP
