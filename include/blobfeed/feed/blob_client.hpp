#pragma once

/** \file blob_client.hpp
 *  \brief Storage collaborator: list blobs under a prefix and read committed byte ranges.
 *
 * Names are '/'-separated and relative to the client's root (container or
 * directory). Implementations must be safe to call from several fetch workers
 * at once.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "blobfeed/error.hpp"

namespace blobfeed::feed {

struct BlobInfo {
  std::string name;
  std::uint64_t length{0};
};

class BlobClient {
public:
  virtual ~BlobClient() = default;

  /** \brief Blobs whose name starts with \p prefix, sorted by name. */
  virtual auto list_blobs(std::string_view prefix)
      -> std::expected<std::vector<BlobInfo>, core::error> = 0;

  /** \brief Reads up to \p length committed bytes at \p offset.
   *  Returns fewer bytes only at the current end of the blob. not_found for a
   *  missing blob, out_of_range when \p offset lies past the end.
   *
   *  \p timeout is the budget for this one attempt and the client owns it: the
   *  reader neither runs a watchdog nor abandons a call in flight. A remote
   *  client must give up once it expires and return timed_out, which the reader
   *  retries with backoff like unavailable. The in-process and local-directory
   *  clients below answer synchronously and never block, so they ignore it. */
  virtual auto read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                          std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, core::error> = 0;
};

/** \brief In-process blob store; append() models a blob growing while being written. */
class MemoryBlobClient final : public BlobClient {
public:
  void put(std::string name, std::vector<std::uint8_t> bytes);
  void append(std::string_view name, std::span<const std::uint8_t> bytes);
  void remove(std::string_view name);

  auto list_blobs(std::string_view prefix)
      -> std::expected<std::vector<BlobInfo>, core::error> override;
  auto read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                  std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, core::error> override;

  /** Number of read_range calls served, and the bytes they returned. */
  std::uint64_t reads() const;
  std::uint64_t bytes_read() const;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<std::uint8_t>, std::less<>> blobs_;
  std::uint64_t reads_{0};
  std::uint64_t bytes_read_{0};
};

/** \brief Serves blob names as files under a local directory (e.g. a mirrored change feed). */
class LocalDirBlobClient final : public BlobClient {
public:
  explicit LocalDirBlobClient(std::filesystem::path root);

  auto list_blobs(std::string_view prefix)
      -> std::expected<std::vector<BlobInfo>, core::error> override;
  auto read_range(std::string_view name, std::uint64_t offset, std::uint64_t length,
                  std::chrono::milliseconds timeout)
      -> std::expected<std::vector<std::uint8_t>, core::error> override;

  const std::filesystem::path& root() const noexcept { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace blobfeed::feed
