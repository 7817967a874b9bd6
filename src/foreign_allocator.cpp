#include "../include/foreign_allocator.hpp"

#include <spdlog/spdlog.h>

namespace mapikit {

std::string foreign_status_name(const ForeignStatus status) {
  switch (status) {
    case foreign_status::S_OK:
      return "S_OK";
    case foreign_status::E_POINTER:
      return "E_POINTER";
    case foreign_status::E_INVALIDARG:
      return "E_INVALIDARG";
    case foreign_status::E_OUTOFMEMORY:
      return "E_OUTOFMEMORY";
    case foreign_status::E_FAIL:
      return "E_FAIL";
    default:
      return spdlog::fmt_lib::format("0x{:08X}", static_cast<uint32_t>(status));
  }
}

}  // namespace mapikit
