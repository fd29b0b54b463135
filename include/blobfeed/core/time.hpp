#pragma once

/** \file time.hpp
 *  \brief UTC timestamps as written by the upstream change log (ISO-8601, 100 ns ticks).
 *
 * Accepted input: YYYY-MM-DDTHH:MM:SS[.f{1,9}](Z|+00:00). Output always uses
 * seven fractional digits and a trailing 'Z', matching the upstream writer.
 */

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

#include "blobfeed/error.hpp"

namespace blobfeed::core {

using timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::expected<timestamp, error>;

[[nodiscard]] auto format_timestamp(timestamp t) -> std::string;

} // namespace blobfeed::core
