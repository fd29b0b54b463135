#include "blobfeed/feed/checkpoint.hpp"

#include <algorithm>

#include "blobfeed/core/platform_utils.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;

namespace {

constexpr std::string_view kHeader = "blobfeed-cursor v1";
constexpr std::string_view kTokenPrefix = "bfc1.";

bool needs_escape(unsigned char c) {
  return c <= 0x20 || c == 0x7F || c == '%' || c == '=' || c == ';';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto line_error(std::size_t line_no, const std::string& what) -> std::unexpected<error> {
  return std::unexpected(error{error_code::data_integrity,
                               "checkpoint parse error at line " + std::to_string(line_no) + ": " + what,
                               "feed.checkpoint"});
}

struct Fields {
  std::vector<std::pair<std::string_view, std::string_view>> kv;

  auto get(std::string_view key) const -> const std::string_view* {
    for (const auto& [k, v] : kv) {
      if (k == key) return &v;
    }
    return nullptr;
  }
};

auto split_fields(std::string_view line) -> Fields {
  Fields f;
  std::size_t pos = 0;
  while (pos < line.size()) {
    auto end = line.find(' ', pos);
    if (end == std::string_view::npos) end = line.size();
    const auto tok = line.substr(pos, end - pos);
    if (!tok.empty()) {
      const auto eq = tok.find('=');
      if (eq != std::string_view::npos) f.kv.emplace_back(tok.substr(0, eq), tok.substr(eq + 1));
    }
    pos = end + 1;
  }
  return f;
}

// Reads the cursor fields shared by shard= and stalled= lines.
auto read_cursor(const Fields& f, std::string_view id_key, std::size_t line_no)
    -> std::expected<ShardCursor, error> {
  ShardCursor c;
  const auto* id = f.get(id_key);
  const auto* chunk = f.get("chunk");
  const auto* offset = f.get("offset");
  const auto* record = f.get("record");
  if (!id || !chunk || !offset || !record) return line_error(line_no, "missing required field(s)");
  auto sid = percent_decode(*id);
  if (!sid || sid->empty()) return line_error(line_no, "invalid " + std::string(id_key) + "=\"" + std::string(*id) + "\"");
  auto ch = percent_decode(*chunk);
  if (!ch) return line_error(line_no, "invalid chunk=\"" + std::string(*chunk) + "\"");
  auto off = core::parse_u64(*offset);
  if (!off) return line_error(line_no, "invalid offset=\"" + std::string(*offset) + "\"");
  auto rec = core::parse_u64(*record);
  if (!rec) return line_error(line_no, "invalid record=\"" + std::string(*record) + "\"");
  c.shard_id = std::move(*sid);
  c.chunk = std::move(*ch);
  c.byte_offset = *off;
  c.record_offset = *rec;
  return c;
}

} // namespace

auto percent_encode(std::string_view raw) -> std::string {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    if (needs_escape(c)) {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0xF]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

auto percent_decode(std::string_view enc) -> std::expected<std::string, error> {
  std::string out;
  out.reserve(enc.size());
  for (std::size_t i = 0; i < enc.size(); ++i) {
    if (enc[i] != '%') { out.push_back(enc[i]); continue; }
    if (i + 2 >= enc.size()) {
      return std::unexpected(error{error_code::data_integrity, "truncated percent escape", "feed.checkpoint"});
    }
    const int hi = hex_value(enc[i + 1]);
    const int lo = hex_value(enc[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::unexpected(error{error_code::data_integrity, "invalid percent escape", "feed.checkpoint"});
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

auto Checkpoint::find_shard(std::string_view shard_id) const noexcept -> const ShardCursor* {
  auto it = std::find_if(shards.begin(), shards.end(), [&](const ShardCursor& c) { return c.shard_id == shard_id; });
  return it == shards.end() ? nullptr : &*it;
}

auto Checkpoint::find_stalled(std::string_view shard_id) const noexcept -> const StalledShard* {
  auto it = std::find_if(stalled.begin(), stalled.end(),
                         [&](const StalledShard& s) { return s.cursor.shard_id == shard_id; });
  return it == stalled.end() ? nullptr : &*it;
}

auto format_checkpoint(const Checkpoint& cp) -> std::string {
  std::string out;
  out.reserve(64 + (cp.shards.size() + cp.stalled.size()) * 128);
  out.append(kHeader).append("\n");
  out.append("generation=").append(std::to_string(cp.generation)).append("\n");
  out.append("segment=").append(percent_encode(cp.segment_id)).append("\n");
  for (const auto& s : cp.shards) {
    out.append("shard=").append(percent_encode(s.shard_id))
       .append(" chunk=").append(percent_encode(s.chunk))
       .append(" offset=").append(std::to_string(s.byte_offset))
       .append(" record=").append(std::to_string(s.record_offset))
       .append("\n");
  }
  for (const auto& s : cp.stalled) {
    out.append("stalled=").append(percent_encode(s.cursor.shard_id))
       .append(" segment=").append(percent_encode(s.segment_id))
       .append(" chunk=").append(percent_encode(s.cursor.chunk))
       .append(" offset=").append(std::to_string(s.cursor.byte_offset))
       .append(" record=").append(std::to_string(s.cursor.record_offset))
       .append(" reason=").append(percent_encode(s.reason))
       .append("\n");
  }
  return out;
}

auto parse_checkpoint(std::string_view text) -> std::expected<Checkpoint, error> {
  Checkpoint cp;
  bool have_header = false, have_generation = false, have_segment = false;
  std::size_t line_no = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(pos, end - pos);
    pos = end + 1;
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (!have_header) {
      if (line != kHeader) return line_error(line_no, "bad header");
      have_header = true;
      continue;
    }
    if (line.empty()) continue;

    const auto f = split_fields(line);
    if (f.kv.empty()) return line_error(line_no, "no key=value fields");
    const auto key = f.kv.front().first;
    const auto value = f.kv.front().second;
    if (key == "generation") {
      auto g = core::parse_u64(value);
      if (!g) return line_error(line_no, "invalid generation=\"" + std::string(value) + "\"");
      cp.generation = *g;
      have_generation = true;
    } else if (key == "segment") {
      auto s = percent_decode(value);
      if (!s) return line_error(line_no, "invalid segment=\"" + std::string(value) + "\"");
      cp.segment_id = std::move(*s);
      have_segment = true;
    } else if (key == "shard") {
      auto c = read_cursor(f, "shard", line_no);
      if (!c) return std::unexpected(c.error());
      if (cp.find_shard(c->shard_id)) return line_error(line_no, "duplicate shard " + c->shard_id);
      cp.shards.push_back(std::move(*c));
    } else if (key == "stalled") {
      auto c = read_cursor(f, "stalled", line_no);
      if (!c) return std::unexpected(c.error());
      const auto* seg = f.get("segment");
      const auto* reason = f.get("reason");
      if (!seg || !reason) return line_error(line_no, "missing required field(s)");
      auto seg_dec = percent_decode(*seg);
      auto reason_dec = percent_decode(*reason);
      if (!seg_dec || !reason_dec) return line_error(line_no, "invalid percent escape");
      cp.stalled.push_back(StalledShard{std::move(*seg_dec), std::move(*c), std::move(*reason_dec)});
    } else {
      return line_error(line_no, "unknown key \"" + std::string(key) + "\"");
    }
  }
  if (!have_header) return line_error(0, "empty input");
  if (!have_generation || !have_segment) return line_error(line_no, "missing generation or segment line");
  return cp;
}

auto to_continuation_token(const Checkpoint& cp) -> std::string {
  return std::string(kTokenPrefix) + percent_encode(format_checkpoint(cp));
}

auto from_continuation_token(std::string_view token) -> std::expected<Checkpoint, error> {
  if (token.substr(0, kTokenPrefix.size()) != kTokenPrefix) {
    return std::unexpected(error{error_code::invalid_argument, "not a continuation token", "feed.checkpoint"});
  }
  auto text = percent_decode(token.substr(kTokenPrefix.size()));
  if (!text) return std::unexpected(text.error());
  return parse_checkpoint(*text);
}

} // namespace blobfeed::feed
