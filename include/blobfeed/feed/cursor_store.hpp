#pragma once

/** \file cursor_store.hpp
 *  \brief Durable checkpoint storage keyed by feed identity, with optimistic concurrency.
 *
 * save(id, cp) succeeds only when the stored generation still equals
 * cp.generation (0 when nothing is stored); the stored copy then carries
 * cp.generation + 1. A mismatch is error_code::conflict and is never retried.
 */

#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "blobfeed/error.hpp"
#include "blobfeed/feed/checkpoint.hpp"

namespace blobfeed::feed {

class CursorStore {
public:
  virtual ~CursorStore() = default;

  /** \brief Stored checkpoint, or nullopt when the identity has never been saved. */
  virtual auto load(std::string_view feed_identity)
      -> std::expected<std::optional<Checkpoint>, core::error> = 0;

  /** \brief Atomically replaces the stored checkpoint (see file comment for the generation rule). */
  virtual auto save(std::string_view feed_identity, const Checkpoint& cp)
      -> std::expected<void, core::error> = 0;
};

class MemoryCursorStore final : public CursorStore {
public:
  auto load(std::string_view feed_identity)
      -> std::expected<std::optional<Checkpoint>, core::error> override;
  auto save(std::string_view feed_identity, const Checkpoint& cp)
      -> std::expected<void, core::error> override;

private:
  std::mutex mu_;
  std::map<std::string, Checkpoint, std::less<>> entries_;
};

/** \brief One "<identity>.cursor" file per feed under a directory.
 *
 * Writes go to a temporary sibling which is fsync'd, renamed over the target
 * and followed by a directory fsync. The generation check reads the current
 * file first, so it is best-effort between processes.
 */
class FileCursorStore final : public CursorStore {
public:
  explicit FileCursorStore(std::filesystem::path dir);

  auto load(std::string_view feed_identity)
      -> std::expected<std::optional<Checkpoint>, core::error> override;
  auto save(std::string_view feed_identity, const Checkpoint& cp)
      -> std::expected<void, core::error> override;

  auto path_for(std::string_view feed_identity) const -> std::filesystem::path;

private:
  std::filesystem::path dir_;
  std::mutex mu_;
};

} // namespace blobfeed::feed
