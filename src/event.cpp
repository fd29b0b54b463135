#include "blobfeed/event.hpp"

#include <array>
#include <charconv>

namespace blobfeed {

using core::error;
using core::error_code;

namespace {

// Variant index order must match EventType; Unknown is last.
constexpr std::array<std::string_view, 10> kTags = {
  "BlobCreated", "BlobDeleted", "BlobMetadataUpdated", "BlobPropertiesUpdated", "BlobRenamed",
  "BlobSnapshotCreated", "BlobTierChanged", "BlobAsyncOperationInitiated",
  "RestorePointMarkerCreated", "Control",
};

template <std::size_t I>
auto make_known(std::size_t idx) -> EventType {
  if constexpr (I < kTags.size()) {
    if (idx == I) return EventType{std::in_place_index<I>};
    return make_known<I + 1>(idx);
  } else {
    return event_types::Unknown{};
  }
}

auto bad_field(std::string_view name, std::string_view why) -> std::unexpected<error> {
  return std::unexpected(error{error_code::data_integrity,
                               "event field \"" + std::string(name) + "\" " + std::string(why), "event"});
}

// Low 64 bits of the upstream hexadecimal sequencer (e.g. "00000000000004420000000000028963").
auto sequencer_value(const avro::Datum& data) -> std::optional<std::uint64_t> {
  const auto* seq = data.field("sequencer");
  if (!seq) return std::nullopt;
  auto text = seq->text();
  if (!text || text->empty()) return std::nullopt;
  auto tail = text->size() > 16 ? text->substr(text->size() - 16) : *text;
  std::uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(tail.data(), tail.data() + tail.size(), v, 16);
  if (ec != std::errc() || ptr != tail.data() + tail.size()) return std::nullopt;
  return v;
}

// First non-null type of a (possibly union) field type.
auto value_type(const avro::Node& node) -> const avro::Node& {
  if (node.type != avro::Type::union_) return node;
  for (const auto* b : node.branches) {
    if (b->type != avro::Type::null) return *b;
  }
  return node;
}

} // namespace

auto parse_event_type(std::string_view tag, std::int32_t raw_index) -> EventType {
  for (std::size_t i = 0; i < kTags.size(); ++i) {
    if (kTags[i] == tag) return make_known<0>(i);
  }
  return event_types::Unknown{std::string(tag), raw_index};
}

auto to_string(const EventType& type) -> std::string {
  if (const auto* u = std::get_if<event_types::Unknown>(&type)) return u->tag;
  return std::string(kTags[type.index()]);
}

auto Event::container() const noexcept -> std::string_view {
  static constexpr std::string_view kContainers = "/containers/";
  static constexpr std::string_view kBlobs = "/blobs/";
  const std::string_view s = subject;
  const auto c = s.find(kContainers);
  if (c == std::string_view::npos) return {};
  const auto start = c + kContainers.size();
  const auto b = s.find(kBlobs, start);
  if (b == std::string_view::npos) return s.substr(start);
  return s.substr(start, b - start);
}

auto Event::blob_path() const noexcept -> std::string_view {
  static constexpr std::string_view kBlobs = "/blobs/";
  const std::string_view s = subject;
  const auto b = s.find(kBlobs);
  if (b == std::string_view::npos) return {};
  return s.substr(b + kBlobs.size());
}

auto event_from_datum(const avro::Datum& record) -> std::expected<Event, error> {
  const auto* r = record.get_if<avro::Record>();
  if (!r) return std::unexpected(error{error_code::data_integrity, "event is not a record", "event"});

  Event ev;
  bool have_id = false, have_type = false, have_subject = false, have_time = false, have_seq = false;
  for (std::size_t i = 0; i < r->names.size(); ++i) {
    const auto& name = r->names[i];
    const auto& v = r->values[i];
    if (name == "id") {
      auto t = v.text();
      if (!t) return bad_field(name, "is not a string");
      ev.id = std::string(*t); have_id = true;
    } else if (name == "eventType") {
      auto t = v.text();
      if (!t) return bad_field(name, "is not a string or enum");
      const auto* en = v.get_if<avro::EnumValue>();
      ev.type = parse_event_type(*t, en ? en->index : -1);
      have_type = true;
    } else if (name == "subject") {
      auto t = v.text();
      if (!t) return bad_field(name, "is not a string");
      ev.subject = std::string(*t); have_subject = true;
    } else if (name == "eventTime") {
      auto t = v.text();
      if (!t) return bad_field(name, "is not a string");
      auto ts = core::parse_timestamp(*t);
      if (!ts) return bad_field(name, "is not an ISO-8601 timestamp");
      ev.event_time = *ts;
      ev.event_time_text = std::string(*t);
      have_time = true;
    } else if (name == "topic") {
      if (auto t = v.text()) ev.topic = std::string(*t);
      else if (!v.is_null()) return bad_field(name, "is not a string or null");
    } else if (name == "schemaVersion") {
      ev.schema_version = v.integer();
    } else if (name == "data") {
      ev.data = v;
    } else if (name == "sequenceNumber") {
      auto n = v.integer();
      if (!n || *n < 0) return bad_field(name, "is not a non-negative integer");
      ev.sequence_number = static_cast<std::uint64_t>(*n); have_seq = true;
    } else {
      ev.extras.names.push_back(name);
      ev.extras.values.push_back(v);
    }
  }
  if (!have_id) return bad_field("id", "is missing");
  if (!have_type) return bad_field("eventType", "is missing");
  if (!have_subject) return bad_field("subject", "is missing");
  if (!have_time) return bad_field("eventTime", "is missing");
  if (!have_seq) ev.sequence_number = sequencer_value(ev.data).value_or(0);
  return ev;
}

auto event_to_datum(const Event& ev, const avro::Node& schema) -> std::expected<avro::Datum, error> {
  if (schema.type != avro::Type::record) {
    return std::unexpected(error{error_code::invalid_argument, "event schema is not a record", "event"});
  }
  avro::Record out;
  out.names.reserve(schema.fields.size());
  out.values.reserve(schema.fields.size());
  for (const auto& f : schema.fields) {
    const auto& vt = value_type(*f.type);
    avro::Datum v;
    if (f.name == "id") {
      v = avro::Datum{ev.id};
    } else if (f.name == "eventType") {
      const auto tag = to_string(ev.type);
      if (vt.type == avro::Type::enum_) {
        int idx = vt.symbol_index(tag);
        if (idx < 0) {
          const auto* u = std::get_if<event_types::Unknown>(&ev.type);
          idx = u ? u->index : -1;
        }
        if (idx < 0) {
          return std::unexpected(error{error_code::invalid_argument,
                                       "event type " + tag + " has no symbol in " + vt.fullname, "event"});
        }
        v = avro::Datum{avro::EnumValue{idx, tag}};
      } else {
        v = avro::Datum{tag};
      }
    } else if (f.name == "subject") {
      v = avro::Datum{ev.subject};
    } else if (f.name == "eventTime") {
      v = avro::Datum{ev.event_time_text.empty() ? core::format_timestamp(ev.event_time) : ev.event_time_text};
    } else if (f.name == "topic") {
      if (ev.topic) v = avro::Datum{*ev.topic};
    } else if (f.name == "schemaVersion") {
      if (ev.schema_version) {
        v = vt.type == avro::Type::int_ ? avro::Datum{static_cast<std::int32_t>(*ev.schema_version)}
                                        : avro::Datum{*ev.schema_version};
      }
    } else if (f.name == "data") {
      v = ev.data;
    } else if (f.name == "sequenceNumber") {
      v = vt.type == avro::Type::int_ ? avro::Datum{static_cast<std::int32_t>(ev.sequence_number)}
                                      : avro::Datum{static_cast<std::int64_t>(ev.sequence_number)};
    } else if (const auto* x = ev.extras.find(f.name)) {
      v = *x;
    }
    out.names.push_back(f.name);
    out.values.push_back(std::move(v));
  }
  return avro::Datum{std::move(out)};
}

} // namespace blobfeed
