#include "blobfeed/error.hpp"

namespace blobfeed::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::corrupt_block: return "corrupt_block";
    case error_code::schema_mismatch: return "schema_mismatch";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::conflict: return "conflict";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::transient_fetch: return "transient_fetch";
    case error_code::timed_out: return "timed_out";
    case error_code::cancelled: return "cancelled";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::string out;
  out.reserve(e.component.size() + e.message.size() + 24);
  if (!e.component.empty()) out.append(e.component).append(": ");
  out.append(e.message).append(" (").append(to_string(e.code)).append(")");
  return out;
}

} // namespace blobfeed::core
