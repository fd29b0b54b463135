#include "blobfeed/feed/segment_catalog.hpp"

#include <algorithm>
#include <charconv>

#include <nlohmann/json.hpp>

#include "blobfeed/log.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;
using json = nlohmann::json;

namespace {

constexpr std::string_view kSegmentsDir = "idx/segments/";
constexpr std::string_view kManifestName = "/meta.json";
constexpr std::string_view kFeedMeta = "meta/segments.json";
constexpr std::string_view kChunkSuffix = ".avro";
constexpr std::chrono::seconds kDefaultInterval{3600};

auto integrity(std::string msg) -> std::unexpected<error> {
  return std::unexpected(error{error_code::data_integrity, std::move(msg), "feed.catalog"});
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

template <class T>
bool read_digits(std::string_view s, T& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 10);
  return ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

auto segment_time_from_id(std::string_view segment_id) -> std::optional<core::timestamp> {
  // "idx/segments/" YYYY "/" MM "/" DD "/" HHMM "/meta.json"
  const auto at = segment_id.find(kSegmentsDir);
  if (at == std::string_view::npos) return std::nullopt;
  const auto rest = segment_id.substr(at + kSegmentsDir.size());
  if (rest.size() < 15 || rest[4] != '/' || rest[7] != '/' || rest[10] != '/') return std::nullopt;
  int y = 0;
  unsigned mo = 0, d = 0, hh = 0, mm = 0;
  if (!read_digits(rest.substr(0, 4), y) || !read_digits(rest.substr(5, 2), mo) ||
      !read_digits(rest.substr(8, 2), d) || !read_digits(rest.substr(11, 2), hh) ||
      !read_digits(rest.substr(13, 2), mm)) {
    return std::nullopt;
  }
  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{mo}, std::chrono::day{d}};
  if (!ymd.ok() || hh > 23 || mm > 59) return std::nullopt;
  return core::timestamp{std::chrono::sys_days{ymd}} + std::chrono::hours{hh} + std::chrono::minutes{mm};
}

auto Shard::find_chunk(std::string_view chunk) const noexcept -> const ChunkInfo* {
  auto it = std::find_if(chunks.begin(), chunks.end(), [&](const ChunkInfo& c) { return c.name == chunk; });
  return it == chunks.end() ? nullptr : &*it;
}

SegmentCatalog::SegmentCatalog(std::shared_ptr<BlobClient> client, CatalogOptions options)
    : client_(std::move(client)), options_(std::move(options)) {}

auto SegmentCatalog::read_small(const std::string& name) -> std::expected<std::optional<std::string>, error> {
  auto bytes = client_->read_range(name, 0, options_.max_manifest_bytes, options_.fetch_timeout);
  if (!bytes) {
    if (bytes.error().code == error_code::not_found) return std::optional<std::string>{};
    return std::unexpected(bytes.error());
  }
  if (bytes->size() >= options_.max_manifest_bytes) {
    return std::unexpected(error{error_code::resource_exhausted, name + " exceeds manifest size limit", "feed.catalog"});
  }
  return std::optional<std::string>{std::string(bytes->begin(), bytes->end())};
}

auto SegmentCatalog::last_consumable() -> std::expected<std::optional<core::timestamp>, error> {
  auto text = read_small(options_.root + std::string(kFeedMeta));
  if (!text) return std::unexpected(text.error());
  if (!*text) return std::optional<core::timestamp>{};
  const auto j = json::parse(**text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return integrity(std::string(kFeedMeta) + " is not a JSON object");
  auto it = j.find("lastConsumable");
  if (it == j.end() || it->is_null()) return std::optional<core::timestamp>{};
  if (!it->is_string()) return integrity("lastConsumable is not a string");
  auto ts = core::parse_timestamp(it->get<std::string>());
  if (!ts) return integrity("lastConsumable: " + ts.error().message);
  return std::optional<core::timestamp>{*ts};
}

auto SegmentCatalog::load_segment(std::string_view segment_id) -> std::expected<Segment, error> {
  const std::string name = options_.root + std::string(segment_id);
  auto text = read_small(name);
  if (!text) return std::unexpected(text.error());
  if (!*text) return std::unexpected(error{error_code::not_found, "no segment manifest " + name, "feed.catalog"});

  const auto j = json::parse(**text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return integrity(name + " is not a JSON object");

  Segment seg;
  seg.id = std::string(segment_id);
  if (auto it = j.find("status"); it != j.end() && it->is_string()) {
    seg.finalized = it->get<std::string>() == "Finalized";
  }
  if (auto it = j.find("begin"); it != j.end() && it->is_string()) {
    auto ts = core::parse_timestamp(it->get<std::string>());
    if (!ts) return integrity(name + ": begin: " + ts.error().message);
    seg.begin = *ts;
  } else if (auto hint = segment_time_from_id(segment_id)) {
    seg.begin = *hint;
  } else {
    return integrity(name + ": no begin time");
  }
  seg.interval = kDefaultInterval;
  if (auto it = j.find("intervalSecs"); it != j.end()) {
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) return integrity(name + ": invalid intervalSecs");
    seg.interval = std::chrono::seconds{it->get<std::int64_t>()};
  }
  if (auto it = j.find("chunkFilePaths"); it != j.end()) {
    if (!it->is_array()) return integrity(name + ": chunkFilePaths is not an array");
    for (const auto& p : *it) {
      if (!p.is_string()) return integrity(name + ": chunkFilePaths entry is not a string");
      auto path = p.get<std::string>();
      if (path.compare(0, options_.root.size(), options_.root) == 0) path.erase(0, options_.root.size());
      if (path.empty()) return integrity(name + ": empty shard path");
      if (path.back() != '/') path.push_back('/');
      seg.shard_ids.push_back(std::move(path));
    }
  }
  return seg;
}

auto SegmentCatalog::segment(std::string_view segment_id) -> std::expected<Segment, error> {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = finalized_.find(segment_id); it != finalized_.end()) return it->second;
  }
  auto seg = load_segment(segment_id);
  if (!seg) return seg;
  if (seg->finalized) {
    std::lock_guard<std::mutex> lk(mu_);
    finalized_.emplace(seg->id, *seg);
    BLOBFEED_LOG_DEBUG("segment {} is finalized with {} shard(s)", seg->id, seg->shard_ids.size());
  }
  return seg;
}

auto SegmentCatalog::is_finalized(std::string_view segment_id) -> std::expected<bool, error> {
  auto seg = segment(segment_id);
  if (!seg) return std::unexpected(seg.error());
  return seg->finalized;
}

auto SegmentCatalog::list_shard(const std::string& shard_id) -> std::expected<Shard, error> {
  Shard shard;
  shard.id = shard_id;
  shard.prefix = options_.root + shard_id;
  auto blobs = client_->list_blobs(shard.prefix);
  if (!blobs) return std::unexpected(blobs.error());
  for (auto& b : *blobs) {
    auto rel = std::string_view(b.name).substr(shard.prefix.size());
    if (rel.find('/') != std::string_view::npos || !ends_with(rel, kChunkSuffix)) continue;
    shard.chunks.push_back(ChunkInfo{std::string(rel), b.length});
  }
  std::sort(shard.chunks.begin(), shard.chunks.end(),
            [](const ChunkInfo& a, const ChunkInfo& b) { return a.name < b.name; });
  return shard;
}

auto SegmentCatalog::shards_of(std::string_view segment_id) -> std::expected<std::vector<Shard>, error> {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (auto it = finalized_shards_.find(segment_id); it != finalized_shards_.end()) return it->second;
  }
  // The manifest is read before the listing: a listing taken after the
  // manifest reported "Finalized" is complete.
  auto seg = segment(segment_id);
  if (!seg) return std::unexpected(seg.error());
  std::vector<Shard> shards;
  shards.reserve(seg->shard_ids.size());
  for (const auto& id : seg->shard_ids) {
    auto s = list_shard(id);
    if (!s) return std::unexpected(s.error());
    s->sealed = seg->finalized;
    shards.push_back(std::move(*s));
  }
  if (seg->finalized) {
    std::lock_guard<std::mutex> lk(mu_);
    finalized_shards_.emplace(seg->id, shards);
  }
  return shards;
}

auto SegmentCatalog::list_segments_from(const std::optional<std::string>& from)
    -> std::expected<std::vector<Segment>, error> {
  auto last = last_consumable();
  if (!last) return std::unexpected(last.error());

  auto blobs = client_->list_blobs(options_.root + std::string(kSegmentsDir));
  if (!blobs) return std::unexpected(blobs.error());

  std::vector<Segment> out;
  for (const auto& b : *blobs) {
    if (!ends_with(b.name, kManifestName)) continue;
    std::string id = b.name.substr(options_.root.size());
    if (from && id < *from) continue;
    // Cheap pre-filter on the time encoded in the path before reading the manifest.
    if (auto hint = segment_time_from_id(id)) {
      if (options_.end_time && *hint >= *options_.end_time) continue;
      if (*last && *hint > **last) continue;
    }
    auto seg = segment(id);
    if (!seg) return std::unexpected(seg.error());
    if (options_.start_time && seg->end() <= *options_.start_time) continue;
    if (options_.end_time && seg->begin >= *options_.end_time) continue;
    if (*last && seg->begin > **last) continue;
    out.push_back(std::move(*seg));
  }
  std::sort(out.begin(), out.end(), [](const Segment& a, const Segment& b) { return a.id < b.id; });
  return out;
}

} // namespace blobfeed::feed
