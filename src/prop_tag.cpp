#include "../include/prop_tag.hpp"

#include <spdlog/spdlog.h>

namespace mapikit {

std::string PropTag::to_string() const {
  return spdlog::fmt_lib::format("0x{:08X}", value_);
}

}  // namespace mapikit
