#pragma once

/** \file container.hpp
 *  \brief Avro Object Container File: header parsing, incremental block decoding, block encoding.
 *
 * Layout (Avro 1.x):
 *   header: 'O' 'b' 'j' 0x01 | metadata map<bytes> | sync[16]
 *   block:  count:long | size:long | data[size] | sync[16]
 *
 * BlockStream is fed bytes starting at a block boundary and yields whole
 * blocks only. The only offsets it ever reports are block boundaries, which
 * are the only valid resume points. A block whose bytes have not all arrived
 * yet is "not complete yet", never an error.
 *
 * Thread-safety: a BlockStream is owned by one shard session; the shared
 * ContainerHeader is immutable.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "blobfeed/avro/codec.hpp"
#include "blobfeed/avro/datum.hpp"
#include "blobfeed/avro/schema.hpp"
#include "blobfeed/error.hpp"

namespace blobfeed::avro {

inline constexpr std::array<std::uint8_t, 4> kContainerMagic{'O', 'b', 'j', 0x01};
inline constexpr std::size_t kSyncSize = 16;
using SyncMarker = std::array<std::uint8_t, kSyncSize>;

struct ContainerHeader {
  Schema schema;
  Codec codec{Codec::null};
  SyncMarker sync{};
  std::map<std::string, std::vector<std::uint8_t>> metadata;
  std::uint64_t size{0};  /**< header length in bytes; the first block starts here */
};

/** \brief Parses a container header from the first bytes of a file.
 *  \return nullopt when more bytes are needed; schema_mismatch for bad magic,
 *          missing/invalid schema or unsupported codec. */
[[nodiscard]] auto parse_header(std::span<const std::uint8_t> bytes)
    -> std::expected<std::optional<ContainerHeader>, core::error>;

struct DecodedBlock {
  std::uint64_t start_offset{0};   /**< absolute offset of the block's first byte */
  std::uint64_t end_offset{0};     /**< absolute offset of the next block (resume point) */
  std::vector<Datum> records;
};

struct BlockLimits {
  std::uint64_t max_block_bytes{64ull * 1024 * 1024};       /**< compressed and inflated */
  std::uint64_t max_block_records{4ull * 1024 * 1024};
};

class BlockStream {
public:
  BlockStream(std::shared_ptr<const ContainerHeader> header, std::uint64_t start_offset,
              BlockLimits limits = {});

  /** \brief Appends bytes that continue exactly at buffered_end(). */
  void append(std::span<const std::uint8_t> bytes);

  /** \brief Decodes the next complete block.
   *  \return nullopt if the buffered bytes do not yet hold a whole block;
   *          corrupt_block on a sync mismatch or undecodable payload. After an
   *          error the stream stays failed until reset(). */
  [[nodiscard]] auto next_block() -> std::expected<std::optional<DecodedBlock>, core::error>;

  /** \brief Drops buffered bytes and restarts at block boundary \p offset. */
  void reset(std::uint64_t offset);

  std::uint64_t offset() const noexcept { return offset_; }
  std::uint64_t buffered_end() const noexcept { return offset_ + (buf_.size() - head_); }
  std::size_t buffered() const noexcept { return buf_.size() - head_; }
  const ContainerHeader& header() const noexcept { return *header_; }

private:
  auto fail(std::string msg) -> std::unexpected<core::error>;
  void compact();

  std::shared_ptr<const ContainerHeader> header_;
  BlockLimits limits_;
  std::vector<std::uint8_t> buf_;
  std::size_t head_{0};        // consumed prefix of buf_
  std::uint64_t offset_{0};    // absolute offset of buf_[head_]
  std::optional<core::error> failed_;
};

/** \brief Produces container bytes: a header once, then independently appendable blocks. */
class ContainerWriter {
public:
  /** \param sync fixed marker (tests, byte-exact fixtures); random when absent. */
  static auto create(std::string_view schema_json, Codec codec,
                     std::optional<SyncMarker> sync = std::nullopt)
      -> std::expected<ContainerWriter, core::error>;

  const std::vector<std::uint8_t>& header_bytes() const noexcept { return header_; }
  const Schema& schema() const noexcept { return schema_; }
  const SyncMarker& sync() const noexcept { return sync_; }

  /** \brief Encodes one block holding \p records (count, size, payload, sync). */
  [[nodiscard]] auto encode_block(std::span<const Datum> records) const
      -> std::expected<std::vector<std::uint8_t>, core::error>;

private:
  Schema schema_;
  Codec codec_{Codec::null};
  SyncMarker sync_{};
  std::vector<std::uint8_t> header_;
};

} // namespace blobfeed::avro
