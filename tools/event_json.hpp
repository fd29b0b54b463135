#pragma once

/** \file event_json.hpp
 *  \brief JSON-lines rendering of delivered events for blobfeed_tail.
 *
 * Upstream strings are not validated as UTF-8; invalid sequences are replaced
 * with U+FFFD instead of aborting the line.
 */

#include <string>

#include <nlohmann/json.hpp>

#include "blobfeed/core/time.hpp"
#include "blobfeed/event.hpp"
#include "blobfeed/feed/shard_reader.hpp"

namespace blobfeed::tools {

inline nlohmann::json event_json(const feed::PositionedEvent& pe) {
    const auto& ev = pe.event;
    nlohmann::json j;
    j["id"] = ev.id;
    j["type"] = blobfeed::to_string(ev.type);
    j["sequence"] = ev.sequence_number;
    j["time"] = ev.event_time_text.empty() ? core::format_timestamp(ev.event_time) : ev.event_time_text;
    j["subject"] = ev.subject;
    j["container"] = std::string(ev.container());
    j["blob"] = std::string(ev.blob_path());
    if (ev.topic) j["topic"] = *ev.topic;
    j["shard"] = pe.cursor.shard_id;
    return j;
}

inline std::string event_json_line(const feed::PositionedEvent& pe) {
    return event_json(pe).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace blobfeed::tools
