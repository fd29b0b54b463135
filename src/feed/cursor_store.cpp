#include "blobfeed/feed/cursor_store.hpp"

#include <fstream>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#include "blobfeed/log.hpp"

namespace blobfeed::feed {

using core::error;
using core::error_code;

namespace {

auto conflict(std::string_view id, std::uint64_t expected_gen, std::uint64_t stored_gen) -> std::unexpected<error> {
  return std::unexpected(error{error_code::conflict,
                               "checkpoint for " + std::string(id) + " is at generation " +
                                   std::to_string(stored_gen) + ", save expected " + std::to_string(expected_gen),
                               "feed.cursor_store"});
}

} // namespace

auto MemoryCursorStore::load(std::string_view feed_identity) -> std::expected<std::optional<Checkpoint>, error> {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(feed_identity);
  if (it == entries_.end()) return std::optional<Checkpoint>{};
  return std::optional<Checkpoint>{it->second};
}

auto MemoryCursorStore::save(std::string_view feed_identity, const Checkpoint& cp) -> std::expected<void, error> {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(feed_identity);
  const std::uint64_t stored = it == entries_.end() ? 0 : it->second.generation;
  if (stored != cp.generation) return conflict(feed_identity, cp.generation, stored);
  Checkpoint next = cp;
  next.generation = cp.generation + 1;
  if (it == entries_.end()) {
    entries_.emplace(std::string(feed_identity), std::move(next));
  } else {
    it->second = std::move(next);
  }
  return {};
}

FileCursorStore::FileCursorStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

auto FileCursorStore::path_for(std::string_view feed_identity) const -> std::filesystem::path {
  // '/' is escaped too so an identity never names a subdirectory.
  std::string name;
  for (char c : percent_encode(feed_identity)) {
    if (c == '/') name.append("%2F");
    else if (c == '\\') name.append("%5C");
    else name.push_back(c);
  }
  if (name.empty() || name == "." || name == "..") name = "%" + name;
  return dir_ / (name + ".cursor");
}

auto FileCursorStore::load(std::string_view feed_identity) -> std::expected<std::optional<Checkpoint>, error> {
  std::lock_guard<std::mutex> lk(mu_);
  const auto p = path_for(feed_identity);
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return std::optional<Checkpoint>{};
    return std::unexpected(error{error_code::io_failed, "cursor open failed: " + p.string(), "feed.cursor_store"});
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  auto cp = parse_checkpoint(buf.str());
  if (!cp) return std::unexpected(cp.error());
  return std::optional<Checkpoint>{std::move(*cp)};
}

auto FileCursorStore::save(std::string_view feed_identity, const Checkpoint& cp) -> std::expected<void, error> {
  std::lock_guard<std::mutex> lk(mu_);
  const auto p_dst = path_for(feed_identity);
  const auto p_tmp = std::filesystem::path(p_dst.string() + ".tmp");

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) return std::unexpected(error{error_code::io_failed, "cursor dir create failed: " + dir_.string(), "feed.cursor_store"});

  std::uint64_t stored = 0;
  {
    std::ifstream in(p_dst, std::ios::binary);
    if (in.good()) {
      std::ostringstream buf;
      buf << in.rdbuf();
      auto current = parse_checkpoint(buf.str());
      if (!current) return std::unexpected(current.error());
      stored = current->generation;
    }
  }
  if (stored != cp.generation) return conflict(feed_identity, cp.generation, stored);

  Checkpoint next = cp;
  next.generation = cp.generation + 1;
  const std::string content = format_checkpoint(next);

  // Leftover tmp from a crashed save.
  std::filesystem::remove(p_tmp, ec);

#if defined(__linux__) || defined(__APPLE__)
  // 1) Write tmp and fsync file
  int fd = ::open(p_tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) return std::unexpected(error{error_code::io_failed, "cursor tmp open failed", "feed.cursor_store"});
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      ::close(fd);
      std::filesystem::remove(p_tmp, ec);
      return std::unexpected(error{error_code::io_failed, "cursor tmp write failed", "feed.cursor_store"});
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    ::close(fd);
    std::filesystem::remove(p_tmp, ec);
    return std::unexpected(error{error_code::io_failed, "cursor tmp fsync failed", "feed.cursor_store"});
  }
  ::close(fd);
#else
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "cursor tmp write failed", "feed.cursor_store"});
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "cursor tmp write failed", "feed.cursor_store"});
  }
#endif

  // 2) Atomic replace
  std::filesystem::rename(p_tmp, p_dst, ec);
  if (ec) {
    std::error_code rec;
    std::filesystem::remove(p_tmp, rec);
    return std::unexpected(error{error_code::io_failed, "cursor rename failed: " + ec.message(), "feed.cursor_store"});
  }

#if defined(__linux__) || defined(__APPLE__)
  // 3) Directory entry durable
  int dfd = ::open(dir_.c_str(), O_RDONLY);
  if (dfd >= 0) {
    (void)::fsync(dfd);
    ::close(dfd);
  }
#endif
  BLOBFEED_LOG_TRACE("cursor {} saved at generation {}", feed_identity, next.generation);
  return {};
}

} // namespace blobfeed::feed
