#include "blobfeed/feed/shard_reader.hpp"

#include <algorithm>
#include <iterator>

#include "blobfeed/log.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;

bool ShardSession::has_unread() const noexcept {
  if (!pending_.empty()) return true;
  if (shard_.chunks.empty()) return false;
  if (cursor_.chunk.empty()) return true;
  auto it = std::find_if(shard_.chunks.begin(), shard_.chunks.end(),
                         [&](const ChunkInfo& c) { return c.name == cursor_.chunk; });
  if (it == shard_.chunks.end()) return true;
  if (std::next(it) != shard_.chunks.end()) return true;
  return cursor_.byte_offset < it->length;
}

ShardReader::ShardReader(std::shared_ptr<BlobClient> client, ShardReaderOptions options,
                         core::CancellationToken cancel)
    : client_(std::move(client)), options_(options), cancel_(std::move(cancel)) {
  options_.range_bytes = std::max<std::uint64_t>(options_.range_bytes, 1);
  options_.max_attempts = std::max<std::uint32_t>(options_.max_attempts, 1);
}

auto ShardReader::open(const Shard& shard, const ShardCursor& cursor) const -> std::expected<ShardSession, error> {
  if (!cursor.chunk.empty() && !shard.find_chunk(cursor.chunk)) {
    return std::unexpected(error{error_code::not_found,
                                 "chunk " + cursor.chunk + " not listed for shard " + shard.id,
                                 "feed.shard_reader"});
  }
  ShardSession s;
  s.shard_ = shard;
  s.cursor_ = cursor;
  s.cursor_.shard_id = shard.id;
  s.skip_ = cursor.record_offset;
  return s;
}

void ShardReader::refresh(ShardSession& session, const Shard& shard) const {
  session.shard_ = shard;
}

auto ShardReader::fetch(const std::string& blob, std::uint64_t offset, std::uint64_t length) const
    -> std::expected<std::vector<std::uint8_t>, error> {
  auto backoff = options_.backoff_initial;
  error last{};
  for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    auto r = client_->read_range(blob, offset, length, options_.fetch_timeout);
    if (r) return r;
    last = r.error();
    if (last.code != error_code::unavailable && last.code != error_code::timed_out) return std::unexpected(last);
    if (attempt == options_.max_attempts) break;
    BLOBFEED_LOG_WARN("fetch {}@{} failed (attempt {}/{}): {}; retrying in {}ms", blob, offset, attempt,
                      options_.max_attempts, core::describe(last), backoff.count());
    if (cancel_.wait_for(backoff)) {
      return std::unexpected(error{error_code::cancelled, "fetch retry cancelled", "feed.shard_reader"});
    }
    backoff = std::min(backoff * 2, options_.backoff_max);
  }
  return std::unexpected(error{error_code::transient_fetch,
                               "fetch " + blob + "@" + std::to_string(offset) + " failed after " +
                                   std::to_string(options_.max_attempts) + " attempt(s): " + last.message,
                               "feed.shard_reader"});
}

auto ShardReader::load_header(ShardSession& s, const ChunkInfo& chunk) const -> std::expected<bool, error> {
  const auto blob = s.shard_.blob_name(chunk.name);
  std::vector<std::uint8_t> buf;
  while (true) {
    auto h = avro::parse_header(buf);
    if (!h) return std::unexpected(h.error());
    if (*h) {
      s.header_ = std::make_shared<const avro::ContainerHeader>(std::move(**h));
      break;
    }
    if (buf.size() >= chunk.length) return false;
    auto bytes = fetch(blob, buf.size(), std::min(options_.range_bytes, chunk.length - buf.size()));
    if (!bytes) return std::unexpected(bytes.error());
    if (bytes->empty()) return false;
    buf.insert(buf.end(), bytes->begin(), bytes->end());
  }

  const auto header_size = s.header_->size;
  if (s.cursor_.byte_offset == 0) {
    s.cursor_.byte_offset = header_size;
    s.cursor_.record_offset = 0;
    s.skip_ = 0;
  } else if (s.cursor_.byte_offset < header_size || s.cursor_.byte_offset > chunk.length) {
    s.header_.reset();
    return std::unexpected(error{error_code::data_integrity,
                                 "cursor offset " + std::to_string(s.cursor_.byte_offset) + " is not a block of " + blob,
                                 "feed.shard_reader"});
  }
  const auto start = s.cursor_.byte_offset;
  s.stream_.emplace(s.header_, start, options_.limits);
  if (buf.size() > start) {
    s.stream_->append(std::span<const std::uint8_t>(buf).subspan(static_cast<std::size_t>(start)));
  }
  BLOBFEED_LOG_TRACE("shard {} chunk {}: codec {}, first block at {}", s.shard_.id, chunk.name,
                     avro::codec_name(s.header_->codec), header_size);
  return true;
}

auto ShardReader::decode_block(ShardSession& s, avro::DecodedBlock block) const -> std::expected<void, error> {
  const std::size_t n = block.records.size();
  std::vector<PositionedEvent> events;
  events.reserve(n);
  for (std::size_t i = static_cast<std::size_t>(std::min<std::uint64_t>(s.skip_, n)); i < n; ++i) {
    auto ev = event_from_datum(block.records[i]);
    if (!ev) {
      return std::unexpected(error{ev.error().code,
                                   "record " + std::to_string(i) + " of block at " +
                                       std::to_string(block.start_offset) + ": " + ev.error().message,
                                   "feed.shard_reader"});
    }
    ShardCursor c{s.shard_.id, s.cursor_.chunk, block.start_offset, i + 1};
    if (i + 1 == n) c = ShardCursor{s.shard_.id, s.cursor_.chunk, block.end_offset, 0};
    events.push_back(PositionedEvent{std::move(*ev), std::move(c)});
  }
  s.skip_ = 0;
  if (events.empty()) {
    // Nothing to hand out; the cursor moves past the block directly.
    if (s.pending_.empty()) s.cursor_ = ShardCursor{s.shard_.id, s.cursor_.chunk, block.end_offset, 0};
    return {};
  }
  for (auto& e : events) s.pending_.push_back(std::move(e));
  return {};
}

void ShardReader::stall(ShardSession& s, const error& e) const {
  s.stall_ = e;
  BLOBFEED_LOG_ERROR("shard {} stalled at {}@{}: {}", s.shard_.id, s.cursor_.chunk, s.cursor_.byte_offset,
                     core::describe(e));
}

auto ShardReader::pull(ShardSession& s, std::size_t max_events) const -> std::expected<PullResult, error> {
  if (s.stall_) return std::unexpected(*s.stall_);

  PullResult out;
  auto finish = [&](bool exhausted) -> std::expected<PullResult, error> {
    out.cursor = s.cursor_;
    out.exhausted_for_now = exhausted;
    return std::move(out);
  };
  // Events already collected are returned; the error shows up again on the next pull.
  auto fail = [&](error e) -> std::expected<PullResult, error> {
    if (out.events.empty()) return std::unexpected(std::move(e));
    BLOBFEED_LOG_DEBUG("shard {}: returning {} event(s) before error: {}", s.shard_.id, out.events.size(),
                       core::describe(e));
    return finish(true);
  };

  while (out.events.size() < max_events) {
    if (!s.pending_.empty()) {
      s.cursor_ = s.pending_.front().cursor;
      out.events.push_back(std::move(s.pending_.front()));
      s.pending_.pop_front();
      continue;
    }
    if (s.shard_.chunks.empty()) return finish(true);
    if (s.cursor_.chunk.empty()) {
      s.cursor_ = ShardCursor{s.shard_.id, s.shard_.chunks.front().name, 0, 0};
      s.skip_ = 0;
    }
    const ChunkInfo* chunk = s.shard_.find_chunk(s.cursor_.chunk);
    if (!chunk) {
      return fail(error{error_code::not_found, "chunk " + s.cursor_.chunk + " no longer listed", "feed.shard_reader"});
    }

    if (!s.header_) {
      auto ready = load_header(s, *chunk);
      if (!ready) {
        if (ready.error().code == error_code::data_integrity) stall(s, ready.error());
        return fail(ready.error());
      }
      if (!*ready) {
        if (!s.shard_.sealed) return finish(true);
        error torn{error_code::corrupt_block, "chunk " + chunk->name + " of sealed shard ends inside its header",
                   "feed.shard_reader"};
        stall(s, torn);
        return fail(std::move(torn));
      }
    }

    auto block = s.stream_->next_block();
    if (!block) {
      stall(s, block.error());
      return fail(block.error());
    }
    if (*block) {
      if (auto d = decode_block(s, std::move(**block)); !d) {
        stall(s, d.error());
        return fail(d.error());
      }
      continue;
    }

    const auto end = s.stream_->buffered_end();
    if (end < chunk->length) {
      auto bytes = fetch(s.shard_.blob_name(chunk->name), end, std::min(options_.range_bytes, chunk->length - end));
      if (!bytes) return fail(bytes.error());
      if (bytes->empty()) return finish(true);
      s.stream_->append(*bytes);
      continue;
    }
    // Listed bytes are consumed; a partial trailing block waits for the writer
    // unless the segment is finalized, in which case it can never complete.
    if (s.stream_->buffered() > 0) {
      if (!s.shard_.sealed) return finish(true);
      error torn{error_code::corrupt_block,
                 "chunk " + chunk->name + " of sealed shard ends with " + std::to_string(s.stream_->buffered()) +
                     " byte(s) of an incomplete block",
                 "feed.shard_reader"};
      stall(s, torn);
      return fail(std::move(torn));
    }

    auto it = std::find_if(s.shard_.chunks.begin(), s.shard_.chunks.end(),
                           [&](const ChunkInfo& c) { return c.name == s.cursor_.chunk; });
    if (it == s.shard_.chunks.end() || std::next(it) == s.shard_.chunks.end()) return finish(true);
    BLOBFEED_LOG_DEBUG("shard {}: chunk {} consumed, moving to {}", s.shard_.id, it->name, std::next(it)->name);
    s.cursor_ = ShardCursor{s.shard_.id, std::next(it)->name, 0, 0};
    s.header_.reset();
    s.stream_.reset();
    s.skip_ = 0;
  }
  return finish(false);
}

} // namespace blobfeed::feed
