#include "tests/support/feed_fixtures.hpp"

#include <cstdio>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace test_support {

using blobfeed::avro::Datum;
using blobfeed::avro::Node;
using blobfeed::avro::Type;

const char* const kEventSchemaJson = R"({
  "type": "record", "name": "BlobChangeEvent", "namespace": "com.microsoft.azure.storage.blob",
  "fields": [
    {"name": "schemaVersion", "type": "int"},
    {"name": "topic", "type": "string"},
    {"name": "subject", "type": "string"},
    {"name": "eventType", "type": {"type": "enum", "name": "BlobChangeEventType", "symbols": [
      "UnspecifiedEventType", "BlobCreated", "BlobDeleted", "BlobPropertiesUpdated", "BlobSnapshotCreated",
      "Control", "BlobAsyncOperationInitiated", "BlobMetadataUpdated", "BlobTierChanged",
      "RestorePointMarkerCreated", "BlobRenamed", "BlobImmutabilityPolicyUpdated"]}},
    {"name": "eventTime", "type": "string"},
    {"name": "id", "type": "string"},
    {"name": "data", "type": {"type": "record", "name": "BlobChangeEventData", "fields": [
      {"name": "api", "type": "string"},
      {"name": "clientRequestId", "type": "string"},
      {"name": "requestId", "type": "string"},
      {"name": "etag", "type": "string"},
      {"name": "contentType", "type": "string"},
      {"name": "contentLength", "type": "long"},
      {"name": "blobType", "type": {"type": "enum", "name": "BlobType", "symbols": ["BlockBlob", "PageBlob", "AppendBlob"]}},
      {"name": "url", "type": "string"},
      {"name": "sequencer", "type": "string"},
      {"name": "previousInfo", "type": ["null", {"type": "map", "values": "string"}], "default": null},
      {"name": "storageDiagnostics", "type": {"type": "map", "values": "string"}}
    ]}},
    {"name": "dataVersion", "type": ["null", "string"], "default": null},
    {"name": "metadataVersion", "type": "string"}
  ]
})";

const char* const kSequencedEventSchemaJson = R"({
  "type": "record", "name": "SequencedChangeEvent", "namespace": "blobfeed.test",
  "fields": [
    {"name": "id", "type": "string"},
    {"name": "sequenceNumber", "type": "long"},
    {"name": "eventType", "type": "string"},
    {"name": "subject", "type": "string"},
    {"name": "eventTime", "type": "string"},
    {"name": "topic", "type": ["null", "string"], "default": null},
    {"name": "data", "type": {"type": "record", "name": "Payload", "fields": [
      {"name": "api", "type": "string"},
      {"name": "contentLength", "type": "long"}
    ]}},
    {"name": "region", "type": "string"}
  ]
})";

std::string event_id(const EventSpec& e) {
  return "evt-" + e.shard + "-" + std::to_string(e.seq);
}

std::string event_time_text(const EventSpec& e) {
  if (!e.time.empty()) return e.time;
  const auto s = e.seq % 86400;
  char buf[40];
  std::snprintf(buf, sizeof(buf), "2024-01-01T%02u:%02u:%02u.0000000Z", static_cast<unsigned>(s / 3600),
                static_cast<unsigned>((s / 60) % 60), static_cast<unsigned>(s % 60));
  return buf;
}

std::string sequencer_hex(std::uint64_t seq) {
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx", 0x442ull, static_cast<unsigned long long>(seq));
  return buf;
}

namespace {

Datum fill(const Node& node, const std::string& name, const EventSpec& e) {
  switch (node.type) {
    case Type::null: return Datum{};
    case Type::boolean: return Datum{false};
    case Type::int_: return Datum{std::int32_t{3}};
    case Type::long_:
      if (name == "sequenceNumber") return Datum{static_cast<std::int64_t>(e.seq)};
      return Datum{static_cast<std::int64_t>(e.seq * 10)};
    case Type::float_: return Datum{0.0f};
    case Type::double_: return Datum{0.0};
    case Type::bytes: return Datum{blobfeed::avro::Bytes{}};
    case Type::string:
      if (name == "sequencer") return Datum{sequencer_hex(e.seq)};
      if (name == "subject") return Datum{"/blobServices/default/containers/" + e.container + "/blobs/" + e.blob};
      if (name == "eventTime") return Datum{event_time_text(e)};
      if (name == "id") return Datum{event_id(e)};
      if (name == "eventType") return Datum{e.type};
      if (name == "topic") return Datum{std::string("/subscriptions/s1/resourceGroups/rg/providers/Microsoft.Storage/storageAccounts/acct")};
      if (name == "url") return Datum{"https://acct.blob.core.windows.net/" + e.container + "/" + e.blob};
      if (name == "region") return Datum{std::string("westus")};
      return Datum{name + "-" + std::to_string(e.seq)};
    case Type::enum_: {
      if (name == "eventType") {
        const int idx = node.symbol_index(e.type);
        if (idx < 0) throw std::runtime_error("event type not in fixture enum: " + e.type);
        return Datum{blobfeed::avro::EnumValue{idx, e.type}};
      }
      return Datum{blobfeed::avro::EnumValue{0, node.symbols.front()}};
    }
    case Type::union_:
      for (const auto* b : node.branches) {
        if (b->type == Type::null) return Datum{};
      }
      return fill(*node.branches.front(), name, e);
    case Type::record: {
      blobfeed::avro::Record r;
      for (const auto& f : node.fields) r.set(f.name, fill(*f.type, f.name, e));
      return Datum{std::move(r)};
    }
    case Type::array: return Datum{blobfeed::avro::Array{}};
    case Type::map: {
      blobfeed::avro::Map m;
      m.keys.push_back("bid");
      m.values.push_back(Datum{"b-" + std::to_string(e.seq)});
      return Datum{std::move(m)};
    }
    case Type::fixed: return Datum{blobfeed::avro::Fixed{std::vector<std::uint8_t>(node.fixed_size, 0)}};
  }
  return Datum{};
}

} // namespace

Datum make_event_datum(const Node& root, const EventSpec& e) {
  blobfeed::avro::Record r;
  for (const auto& f : root.fields) {
    if (f.name == "topic" && f.type->type == Type::union_) {
      r.set(f.name, Datum{std::string("/subscriptions/s1/resourceGroups/rg")});
    } else if (f.name == "dataVersion") {
      r.set(f.name, Datum{std::string("3")});
    } else {
      r.set(f.name, fill(*f.type, f.name, e));
    }
  }
  return Datum{std::move(r)};
}

ShardBuilder::ShardBuilder(std::string schema_json, blobfeed::avro::Codec codec) {
  auto w = blobfeed::avro::ContainerWriter::create(schema_json, codec, kTestSync);
  if (!w) throw std::runtime_error("fixture writer: " + w.error().message);
  writer_ = std::move(*w);
}

std::vector<std::uint8_t> ShardBuilder::block(const std::vector<EventSpec>& events) const {
  std::vector<Datum> records;
  records.reserve(events.size());
  for (const auto& e : events) records.push_back(make_event_datum(writer_.schema().root(), e));
  auto b = writer_.encode_block(records);
  if (!b) throw std::runtime_error("fixture block: " + b.error().message);
  return std::move(*b);
}

std::vector<std::uint8_t> ShardBuilder::container(const std::vector<std::vector<EventSpec>>& blocks) const {
  std::vector<std::uint8_t> out = header();
  for (const auto& events : blocks) {
    auto b = block(events);
    out.insert(out.end(), b.begin(), b.end());
  }
  return out;
}

std::vector<EventSpec> events_for(std::string shard, std::uint64_t seq_begin, std::uint64_t seq_end) {
  std::vector<EventSpec> out;
  for (auto s = seq_begin; s < seq_end; ++s) {
    EventSpec e;
    e.seq = s;
    e.shard = shard;
    e.blob = "dir/blob-" + shard + "-" + std::to_string(s) + ".bin";
    out.push_back(std::move(e));
  }
  return out;
}

FeedLayout::FeedLayout(std::shared_ptr<blobfeed::feed::MemoryBlobClient> client, std::string root)
    : client_(std::move(client)), root_(std::move(root)) {}

std::string FeedLayout::shard_id(std::string_view shard_number, std::string_view time_path) {
  return "log/" + std::string(shard_number) + "/" + std::string(time_path) + "/";
}

std::string FeedLayout::add_segment(std::string_view time_path, bool finalized,
                                    const std::vector<std::string>& shard_numbers) {
  SegmentSpec s;
  s.id = "idx/segments/" + std::string(time_path) + "/meta.json";
  s.time_path = std::string(time_path);
  s.finalized = finalized;
  for (const auto& n : shard_numbers) s.shard_ids.push_back(shard_id(n, time_path));
  segments_.push_back(s);
  write_manifest(s.id);
  return s.id;
}

void FeedLayout::finalize(const std::string& segment_id) {
  for (auto& s : segments_) {
    if (s.id == segment_id) s.finalized = true;
  }
  write_manifest(segment_id);
}

void FeedLayout::write_manifest(const std::string& segment_id) {
  for (const auto& s : segments_) {
    if (s.id != segment_id) continue;
    // "YYYY/MM/DD/HHMM" -> "YYYY-MM-DDTHH:MM:00.000Z"
    const auto& t = s.time_path;
    const std::string begin = t.substr(0, 4) + "-" + t.substr(5, 2) + "-" + t.substr(8, 2) + "T" + t.substr(11, 2) +
                              ":" + t.substr(13, 2) + ":00.000Z";
    nlohmann::json j;
    j["version"] = 0;
    j["begin"] = begin;
    j["intervalSecs"] = 3600;
    j["status"] = s.finalized ? "Finalized" : "Publishing";
    j["config"] = {{"version", 0}, {"configVersionEtag", "0x8D69"}, {"numShards", s.shard_ids.size()}};
    auto paths = nlohmann::json::array();
    for (const auto& id : s.shard_ids) paths.push_back(root_ + id);
    j["chunkFilePaths"] = paths;
    j["storageDiagnostics"] = {{"version", 0}, {"lastModifiedTime", begin}};
    const auto text = j.dump(2);
    client_->put(root_ + s.id, std::vector<std::uint8_t>(text.begin(), text.end()));
  }
}

void FeedLayout::set_last_consumable(std::string_view iso_time) {
  nlohmann::json j;
  j["version"] = 0;
  j["lastConsumable"] = std::string(iso_time);
  j["storageDiagnostics"] = {{"version", 0}};
  const auto text = j.dump();
  client_->put(root_ + "meta/segments.json", std::vector<std::uint8_t>(text.begin(), text.end()));
}

void FeedLayout::put_chunk(const std::string& shard_id, std::string_view chunk, std::vector<std::uint8_t> bytes) {
  client_->put(root_ + shard_id + std::string(chunk), std::move(bytes));
}

void FeedLayout::append_chunk(const std::string& shard_id, std::string_view chunk,
                              const std::vector<std::uint8_t>& bytes) {
  client_->append(root_ + shard_id + std::string(chunk), bytes);
}

void FlakyBlobClient::fail_next_reads(int n, blobfeed::core::error_code code) {
  std::lock_guard<std::mutex> lk(mu_);
  remaining_failures_ = n;
  failure_code_ = code;
}

auto FlakyBlobClient::list_blobs(std::string_view prefix)
    -> std::expected<std::vector<blobfeed::feed::BlobInfo>, blobfeed::core::error> {
  return inner_->list_blobs(prefix);
}

auto FlakyBlobClient::read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                                 std::chrono::milliseconds timeout)
    -> std::expected<std::vector<std::uint8_t>, blobfeed::core::error> {
  ++attempts_;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (remaining_failures_ > 0) {
      --remaining_failures_;
      return std::unexpected(blobfeed::core::error{failure_code_, "injected failure", "test.flaky_client"});
    }
  }
  return inner_->read_range(name, offset, length, timeout);
}

std::filesystem::path make_temp_dir(const std::string& name) {
  auto dir = std::filesystem::temp_directory_path() / ("blobfeed_test_" + name);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

} // namespace test_support
