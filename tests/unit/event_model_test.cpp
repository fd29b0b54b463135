#include <catch2/catch_all.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "blobfeed/avro/binary.hpp"
#include "blobfeed/avro/datum.hpp"
#include "blobfeed/avro/schema.hpp"
#include "blobfeed/event.hpp"
#include "tests/support/feed_fixtures.hpp"

using namespace blobfeed;
using blobfeed::core::error_code;
using test_support::EventSpec;

namespace {

avro::Schema schema_of(const char* json) {
  auto s = avro::Schema::parse(json);
  REQUIRE(s.has_value());
  return *s;
}

} // namespace

TEST_CASE("known tags map to their variants and back", "[event]") {
  REQUIRE(std::holds_alternative<event_types::Created>(parse_event_type("BlobCreated")));
  REQUIRE(std::holds_alternative<event_types::Deleted>(parse_event_type("BlobDeleted")));
  REQUIRE(std::holds_alternative<event_types::TierChanged>(parse_event_type("BlobTierChanged")));
  REQUIRE(std::holds_alternative<event_types::Control>(parse_event_type("Control")));
  REQUIRE(to_string(parse_event_type("RestorePointMarkerCreated")) == "RestorePointMarkerCreated");

  auto u = parse_event_type("BlobTeleported", 42);
  const auto* unk = std::get_if<event_types::Unknown>(&u);
  REQUIRE(unk != nullptr);
  REQUIRE(unk->tag == "BlobTeleported");
  REQUIRE(unk->index == 42);
  REQUIRE(to_string(u) == "BlobTeleported");
}

TEST_CASE("change-feed record decodes into an event", "[event]") {
  auto schema = schema_of(test_support::kEventSchemaJson);
  EventSpec fixture;
  fixture.seq = 0x28963;
  fixture.type = "BlobDeleted";
  fixture.container = "logs";
  fixture.blob = "2024/01/app.log";
  auto ev = event_from_datum(test_support::make_event_datum(schema.root(), fixture));
  REQUIRE(ev.has_value());
  REQUIRE(ev->id == test_support::event_id(fixture));
  REQUIRE(std::holds_alternative<event_types::Deleted>(ev->type));
  REQUIRE(ev->sequence_number == 0x28963);  // low half of the data.sequencer
  REQUIRE(ev->schema_version == 3);
  REQUIRE(ev->container() == "logs");
  REQUIRE(ev->blob_path() == "2024/01/app.log");
  REQUIRE(core::format_timestamp(ev->event_time) == test_support::event_time_text(fixture));
  REQUIRE(ev->data.field("api") != nullptr);
  REQUIRE(ev->extras.find("metadataVersion") != nullptr);
  REQUIRE(ev->extras.find("dataVersion") != nullptr);
  REQUIRE_FALSE(ev->is_control());
}

TEST_CASE("enum symbols unknown to the library decode to Unknown with the raw index", "[event]") {
  auto schema = schema_of(test_support::kEventSchemaJson);
  EventSpec fixture;
  fixture.type = "BlobImmutabilityPolicyUpdated";
  const auto record = test_support::make_event_datum(schema.root(), fixture);
  auto ev = event_from_datum(record);
  REQUIRE(ev.has_value());
  const auto* unk = std::get_if<event_types::Unknown>(&ev->type);
  REQUIRE(unk != nullptr);
  REQUIRE(unk->tag == "BlobImmutabilityPolicyUpdated");
  REQUIRE(unk->index == 11);

  auto back = event_to_datum(*ev, schema.root());
  REQUIRE(back.has_value());
  REQUIRE(*back == record);
}

TEST_CASE("events re-encode to the record they came from", "[event]") {
  SECTION("upstream schema") {
    auto schema = schema_of(test_support::kEventSchemaJson);
    const auto record = test_support::make_event_datum(schema.root(), EventSpec{.seq = 17});
    auto ev = event_from_datum(record);
    REQUIRE(ev.has_value());
    auto back = event_to_datum(*ev, schema.root());
    REQUIRE(back.has_value());
    REQUIRE(*back == record);
  }
  SECTION("schema with a top-level sequence number and extra fields") {
    auto schema = schema_of(test_support::kSequencedEventSchemaJson);
    const auto record = test_support::make_event_datum(schema.root(), EventSpec{.seq = 99, .type = "Control"});
    auto ev = event_from_datum(record);
    REQUIRE(ev.has_value());
    REQUIRE(ev->sequence_number == 99);
    REQUIRE(ev->is_control());
    REQUIRE_FALSE(ev->schema_version.has_value());
    REQUIRE(ev->extras.find("region")->text() == "westus");
    auto back = event_to_datum(*ev, schema.root());
    REQUIRE(back.has_value());
    REQUIRE(*back == record);
  }
}

TEST_CASE("an event type with no enum symbol cannot be encoded", "[event]") {
  auto schema = schema_of(test_support::kEventSchemaJson);
  auto ev = event_from_datum(test_support::make_event_datum(schema.root(), EventSpec{}));
  REQUIRE(ev.has_value());
  ev->type = event_types::Unknown{"BlobTeleported", -1};
  auto r = event_to_datum(*ev, schema.root());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::invalid_argument);
}

TEST_CASE("missing or malformed envelope fields are data_integrity", "[event]") {
  auto schema = schema_of(test_support::kSequencedEventSchemaJson);
  const auto good = test_support::make_event_datum(schema.root(), EventSpec{.seq = 5});
  const auto* rec = good.get_if<avro::Record>();
  REQUIRE(rec != nullptr);

  auto without = [&](std::string_view name) {
    avro::Record r;
    for (std::size_t i = 0; i < rec->names.size(); ++i) {
      if (rec->names[i] != name) r.set(rec->names[i], rec->values[i]);
    }
    return avro::Datum{std::move(r)};
  };
  for (const char* name : {"id", "eventType", "subject", "eventTime"}) {
    INFO(name);
    auto ev = event_from_datum(without(name));
    REQUIRE_FALSE(ev.has_value());
    REQUIRE(ev.error().code == error_code::data_integrity);
    REQUIRE(ev.error().message.find(name) != std::string::npos);
  }

  avro::Record bad_time = *rec;
  bad_time.set("eventTime", avro::Datum{std::string("yesterday")});
  REQUIRE(event_from_datum(avro::Datum{bad_time}).error().code == error_code::data_integrity);

  avro::Record negative = *rec;
  negative.set("sequenceNumber", avro::Datum{std::int64_t{-1}});
  REQUIRE(event_from_datum(avro::Datum{negative}).error().code == error_code::data_integrity);

  REQUIRE(event_from_datum(avro::Datum{std::string("x")}).error().code == error_code::data_integrity);
}

TEST_CASE("subjects of another shape leave container and blob empty", "[event]") {
  Event ev;
  ev.subject = "/blobServices/default/containers/only-container";
  REQUIRE(ev.container() == "only-container");
  REQUIRE(ev.blob_path().empty());
  ev.subject = "/something/else";
  REQUIRE(ev.container().empty());
  REQUIRE(ev.blob_path().empty());
}

TEST_CASE("a null topic and the upstream time text survive re-encoding", "[event]") {
  auto schema = schema_of(R"({
    "type": "record", "name": "NullableTopicEvent",
    "fields": [
      {"name": "topic", "type": ["null", "string"], "default": null},
      {"name": "subject", "type": "string"},
      {"name": "eventType", "type": "string"},
      {"name": "eventTime", "type": "string"},
      {"name": "id", "type": "string"},
      {"name": "data", "type": {"type": "record", "name": "NullableTopicData",
                                "fields": [{"name": "sequencer", "type": "string"}]}}
    ]})");

  auto build = [](avro::Datum topic, std::string time) {
    avro::Record data;
    data.set("sequencer", avro::Datum{std::string("00000000000000000000000000000011")});
    avro::Record r;
    r.set("topic", std::move(topic));
    r.set("subject", avro::Datum{std::string("/blobServices/default/containers/c/blobs/b")});
    r.set("eventType", avro::Datum{std::string("BlobCreated")});
    r.set("eventTime", avro::Datum{std::move(time)});
    r.set("id", avro::Datum{std::string("evt")});
    r.set("data", avro::Datum{std::move(data)});
    return avro::Datum{std::move(r)};
  };

  for (const char* time : {"2022-02-17T13:08:42.48Z", "2022-02-17T13:08:42+00:00", "2022-02-17T13:08:42.123456789Z"}) {
    INFO(time);
    for (bool null_topic : {true, false}) {
      const auto record = build(null_topic ? avro::Datum{} : avro::Datum{std::string("/subscriptions/x")}, time);
      std::vector<std::uint8_t> original;
      REQUIRE(avro::encode_datum(original, schema.root(), record).has_value());

      avro::BinaryReader in(original);
      auto decoded = avro::decode_datum(in, schema.root());
      REQUIRE(decoded.has_value());
      auto ev = event_from_datum(*decoded);
      REQUIRE(ev.has_value());
      REQUIRE(ev->topic.has_value() == !null_topic);
      REQUIRE(ev->event_time_text == time);

      auto back = event_to_datum(*ev, schema.root());
      REQUIRE(back.has_value());
      REQUIRE(back->field("topic")->is_null() == null_topic);
      REQUIRE(*back->field("eventTime")->text() == time);
      std::vector<std::uint8_t> reencoded;
      REQUIRE(avro::encode_datum(reencoded, schema.root(), *back).has_value());
      REQUIRE(reencoded == original);
    }
  }
}

TEST_CASE("a topic that is neither string nor null is rejected", "[event]") {
  avro::Record r;
  r.set("topic", avro::Datum{std::int64_t{5}});
  r.set("subject", avro::Datum{std::string("/blobServices/default/containers/c/blobs/b")});
  r.set("eventType", avro::Datum{std::string("BlobCreated")});
  r.set("eventTime", avro::Datum{std::string("2022-02-17T13:08:42Z")});
  r.set("id", avro::Datum{std::string("evt")});
  auto ev = event_from_datum(avro::Datum{std::move(r)});
  REQUIRE_FALSE(ev.has_value());
  REQUIRE(ev.error().code == error_code::data_integrity);
}
