#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once published.
 * - Human-readable message and originating component for diagnostics.
 * - Shard-scoped failures (transient_fetch, corrupt_block) are isolated by the
 *   sequencer; schema_mismatch aborts a run; conflict is never retried.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace blobfeed::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  corrupt_block = 3002,     /**< block sync marker / payload integrity failure */
  schema_mismatch = 3003,   /**< unsupported container version, codec or schema */
  precondition_failed = 4001,
  conflict = 4002,          /**< optimistic concurrency violation on checkpoint save */
  resource_exhausted = 5001,
  not_found = 6001,
  unavailable = 7001,       /**< storage service temporarily unreachable */
  transient_fetch = 7002,   /**< fetch retries exhausted; retry later */
  timed_out = 7003,
  cancelled = 8001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "feed.shard_reader" */
};

/** \brief Stable lowercase name of a code, e.g. "corrupt_block". */
auto to_string(error_code code) noexcept -> std::string_view;

/** \brief Whether an operation failing with \p code may succeed when simply retried. */
constexpr bool is_retriable(error_code code) noexcept {
  switch (code) {
    case error_code::unavailable:
    case error_code::transient_fetch:
    case error_code::timed_out:
    case error_code::io_failed:
      return true;
    default:
      return false;
  }
}

/** \brief Formats "component: message (code)" for logs. */
auto describe(const error& e) -> std::string;

} // namespace blobfeed::core
