#pragma once

/** \file event.hpp
 *  \brief Change-feed event: the typed form of one record of a shard chunk.
 *
 * The event type is a closed variant. Tags the library does not know decode
 * to event_types::Unknown carrying the raw tag, so newer upstream schemas
 * never break decoding. Fields beyond the common envelope are preserved in
 * `extras` and `data` so an event re-encodes to the record it came from.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "blobfeed/avro/datum.hpp"
#include "blobfeed/avro/schema.hpp"
#include "blobfeed/core/time.hpp"
#include "blobfeed/error.hpp"

namespace blobfeed {

namespace event_types {
struct Created { bool operator==(const Created&) const = default; };
struct Deleted { bool operator==(const Deleted&) const = default; };
struct MetadataUpdated { bool operator==(const MetadataUpdated&) const = default; };
struct PropertiesUpdated { bool operator==(const PropertiesUpdated&) const = default; };
struct Renamed { bool operator==(const Renamed&) const = default; };
struct SnapshotCreated { bool operator==(const SnapshotCreated&) const = default; };
struct TierChanged { bool operator==(const TierChanged&) const = default; };
struct AsyncOperationInitiated { bool operator==(const AsyncOperationInitiated&) const = default; };
struct RestorePointMarkerCreated { bool operator==(const RestorePointMarkerCreated&) const = default; };
/** Upstream bookkeeping record; not a change to any blob. */
struct Control { bool operator==(const Control&) const = default; };
struct Unknown {
  std::string tag;          /**< raw discriminator text */
  std::int32_t index{-1};   /**< raw enum index when the schema declares an enum, else -1 */
  bool operator==(const Unknown&) const = default;
};
} // namespace event_types

using EventType = std::variant<event_types::Created, event_types::Deleted, event_types::MetadataUpdated,
                               event_types::PropertiesUpdated, event_types::Renamed,
                               event_types::SnapshotCreated, event_types::TierChanged,
                               event_types::AsyncOperationInitiated,
                               event_types::RestorePointMarkerCreated, event_types::Control,
                               event_types::Unknown>;

/** \brief Maps an upstream tag ("BlobCreated", ...) to its variant; never fails. */
auto parse_event_type(std::string_view tag, std::int32_t raw_index = -1) -> EventType;

/** \brief Upstream tag for a type; Unknown yields its raw tag. */
auto to_string(const EventType& type) -> std::string;

struct Event {
  std::string id;
  std::uint64_t sequence_number{0};
  EventType type{event_types::Unknown{}};
  std::string subject;
  core::timestamp event_time{};
  std::string event_time_text;           /**< upstream text, re-emitted verbatim; empty: format event_time */
  std::optional<std::string> topic;      /**< nullopt when the record holds null */
  std::optional<std::int64_t> schema_version;
  avro::Datum data;        /**< event-type-specific record, opaque */
  avro::Record extras;     /**< remaining top-level fields, in record order */

  /** Container name parsed from the subject, empty if the subject has another shape. */
  auto container() const noexcept -> std::string_view;
  /** Blob path parsed from the subject, empty if the subject has another shape. */
  auto blob_path() const noexcept -> std::string_view;

  bool is_control() const noexcept { return std::holds_alternative<event_types::Control>(type); }
};

/** \brief Builds an Event from a decoded record; data_integrity if a common field is missing or malformed. */
[[nodiscard]] auto event_from_datum(const avro::Datum& record) -> std::expected<Event, core::error>;

/** \brief Inverse of event_from_datum for the record schema \p schema. */
[[nodiscard]] auto event_to_datum(const Event& event, const avro::Node& schema)
    -> std::expected<avro::Datum, core::error>;

} // namespace blobfeed
