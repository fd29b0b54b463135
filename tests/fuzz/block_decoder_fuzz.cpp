#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "blobfeed/avro/container.hpp"
#include "blobfeed/event.hpp"

// Fuzzer: arbitrary bytes as a container file, fed to the header parser and
// the block stream in uneven pieces. Every outcome must be a value or an error.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace blobfeed::avro;
  const std::span<const std::uint8_t> bytes(data, size);
  auto h = parse_header(bytes);
  if (!h || !*h) return 0;

  auto header = std::make_shared<const ContainerHeader>(std::move(**h));
  BlockStream stream(header, header->size, BlockLimits{1u << 20, 1u << 16});
  std::size_t pos = static_cast<std::size_t>(header->size);
  std::size_t piece = 1;
  while (pos < size) {
    const std::size_t n = std::min(piece, size - pos);
    stream.append(bytes.subspan(pos, n));
    pos += n;
    piece = piece * 2 + 1;
    while (true) {
      auto b = stream.next_block();
      if (!b || !*b) break;
      for (const auto& record : (*b)->records) {
        auto ev = blobfeed::event_from_datum(record);
        if (ev) (void)blobfeed::event_to_datum(*ev, header->schema.root());
      }
    }
  }
  return 0;
}
