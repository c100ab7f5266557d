#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; callers branch on the code,
 *   never on the message text.
 * - Human-readable message and originating component for diagnostics.
 * - Transient codes (embedding_unavailable, timeout) are the only ones a caller
 *   should retry.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace gleaner::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  dimension_mismatch = 4002,
  not_found = 6001,
  embedding_unavailable = 7001,
  timeout = 7002,
  ingestion_failed = 8001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.wal" */
};

/** \brief Stable lower-case name of a code, for logs and failure reasons. */
auto to_string(error_code code) noexcept -> std::string_view;

/** \brief True for failures a caller may retry with backoff. */
inline bool is_transient(const error& e) noexcept {
  return e.code == error_code::embedding_unavailable || e.code == error_code::timeout;
}

inline auto make_unexpected(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace gleaner::core
