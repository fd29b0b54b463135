#include "blobfeed/feed/blob_client.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace blobfeed::feed {

using core::error;
using core::error_code;

void MemoryBlobClient::put(std::string name, std::vector<std::uint8_t> bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  blobs_[std::move(name)] = std::move(bytes);
}

void MemoryBlobClient::append(std::string_view name, std::span<const std::uint8_t> bytes) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = blobs_.find(name);
  if (it == blobs_.end()) it = blobs_.emplace(std::string(name), std::vector<std::uint8_t>{}).first;
  it->second.insert(it->second.end(), bytes.begin(), bytes.end());
}

void MemoryBlobClient::remove(std::string_view name) {
  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = blobs_.find(name); it != blobs_.end()) blobs_.erase(it);
}

auto MemoryBlobClient::list_blobs(std::string_view prefix) -> std::expected<std::vector<BlobInfo>, error> {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<BlobInfo> out;
  for (auto it = blobs_.lower_bound(prefix); it != blobs_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    out.push_back(BlobInfo{it->first, it->second.size()});
  }
  return out;
}

auto MemoryBlobClient::read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                                  std::chrono::milliseconds)
    -> std::expected<std::vector<std::uint8_t>, error> {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = blobs_.find(name);
  if (it == blobs_.end()) {
    return std::unexpected(error{error_code::not_found, "no blob " + std::string(name), "feed.blob_client"});
  }
  const auto& b = it->second;
  if (offset > b.size()) {
    return std::unexpected(error{error_code::out_of_range,
                                 "offset " + std::to_string(offset) + " past end of " + std::string(name),
                                 "feed.blob_client"});
  }
  const auto n = static_cast<std::size_t>(std::min<std::uint64_t>(length, b.size() - offset));
  ++reads_;
  bytes_read_ += n;
  return std::vector<std::uint8_t>(b.begin() + static_cast<std::ptrdiff_t>(offset),
                                   b.begin() + static_cast<std::ptrdiff_t>(offset + n));
}

std::uint64_t MemoryBlobClient::reads() const {
  std::lock_guard<std::mutex> lk(mu_);
  return reads_;
}

std::uint64_t MemoryBlobClient::bytes_read() const {
  std::lock_guard<std::mutex> lk(mu_);
  return bytes_read_;
}

namespace {

// Rejects absolute names and any ".." segment so reads stay under the root.
bool is_safe_name(std::string_view name) {
  if (name.empty() || name.front() == '/' || name.find('\\') != std::string_view::npos) return false;
  std::size_t pos = 0;
  while (pos <= name.size()) {
    auto end = name.find('/', pos);
    if (end == std::string_view::npos) end = name.size();
    if (name.substr(pos, end - pos) == "..") return false;
    pos = end + 1;
  }
  return true;
}

} // namespace

LocalDirBlobClient::LocalDirBlobClient(std::filesystem::path root) : root_(std::move(root)) {}

auto LocalDirBlobClient::list_blobs(std::string_view prefix) -> std::expected<std::vector<BlobInfo>, error> {
  std::vector<BlobInfo> out;
  // Walk only the deepest directory the prefix names.
  const auto slash = prefix.rfind('/');
  const std::string dir_part = slash == std::string_view::npos ? std::string() : std::string(prefix.substr(0, slash));
  if (!dir_part.empty() && !is_safe_name(dir_part)) {
    return std::unexpected(error{error_code::invalid_argument, "unsafe prefix " + std::string(prefix),
                                 "feed.blob_client"});
  }
  const auto start = dir_part.empty() ? root_ : root_ / dir_part;
  std::error_code ec;
  if (!std::filesystem::is_directory(start, ec)) return out;

  std::filesystem::recursive_directory_iterator it(start, ec), end;
  if (ec) return std::unexpected(error{error_code::io_failed, "list " + start.string() + ": " + ec.message(),
                                       "feed.blob_client"});
  for (; it != end; it.increment(ec)) {
    if (ec) return std::unexpected(error{error_code::io_failed, "list " + start.string() + ": " + ec.message(),
                                         "feed.blob_client"});
    if (!it->is_regular_file(ec)) continue;
    auto name = it->path().lexically_relative(root_).generic_string();
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    const auto size = it->file_size(ec);
    if (ec) continue; // removed while listing
    out.push_back(BlobInfo{std::move(name), size});
  }
  std::sort(out.begin(), out.end(), [](const BlobInfo& a, const BlobInfo& b) { return a.name < b.name; });
  return out;
}

auto LocalDirBlobClient::read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                                    std::chrono::milliseconds)
    -> std::expected<std::vector<std::uint8_t>, error> {
  if (!is_safe_name(name)) {
    return std::unexpected(error{error_code::invalid_argument, "unsafe blob name " + std::string(name),
                                 "feed.blob_client"});
  }
  const auto p = root_ / std::string(name);
  std::error_code ec;
  const auto size = std::filesystem::file_size(p, ec);
  if (ec) return std::unexpected(error{error_code::not_found, "no blob " + std::string(name), "feed.blob_client"});
  if (offset > size) {
    return std::unexpected(error{error_code::out_of_range,
                                 "offset " + std::to_string(offset) + " past end of " + std::string(name),
                                 "feed.blob_client"});
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) return std::unexpected(error{error_code::io_failed, "open failed: " + p.string(), "feed.blob_client"});
  std::vector<std::uint8_t> out(static_cast<std::size_t>(std::min<std::uint64_t>(length, size - offset)));
  in.seekg(static_cast<std::streamoff>(offset));
  in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  out.resize(static_cast<std::size_t>(in.gcount()));
  if (in.bad()) return std::unexpected(error{error_code::io_failed, "read failed: " + p.string(), "feed.blob_client"});
  return out;
}

} // namespace blobfeed::feed
