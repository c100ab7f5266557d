#include "gleaner/error.hpp"

namespace gleaner::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::not_found: return "not_found";
    case error_code::embedding_unavailable: return "embedding_unavailable";
    case error_code::timeout: return "timeout";
    case error_code::ingestion_failed: return "ingestion_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace gleaner::core
