// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace proximity {
namespace network {

/**
 * FrameCodec - length-prefixed framing over a narrow link
 *
 * Wire format: [length: u16 big-endian][payload]. A frame is written as one
 * or more sequential chunks of at most MTU bytes; chunk boundaries carry no
 * meaning.
 */
class FrameCodec {
public:
  // Header + payload. Caller guarantees payload.size() <= MAX_FRAME_SIZE_LIMIT.
  [[nodiscard]] static std::vector<uint8_t> encode(const std::vector<uint8_t>& payload);

  // Split an encoded frame into MTU-sized writes. mtu == 0 is treated as 1.
  [[nodiscard]] static std::vector<std::vector<uint8_t>> fragment(const std::vector<uint8_t>& frame, size_t mtu);

  // Bytes of the next write starting at offset
  [[nodiscard]] static size_t chunk_size(size_t frame_size, size_t offset, size_t mtu) noexcept;
};

/**
 * FrameReassembler - per-peer, per-channel inbound stream state
 *
 * Chunks are appended as they arrive; every completed frame is returned and
 * partial data of the next frame is kept. A declared length above the
 * configured maximum is counted as rejected and its payload bytes are
 * skipped so the stream stays in sync. Buffered data never exceeds
 * header + max_frame_size bytes.
 */
class FrameReassembler {
public:
  struct Result {
    std::vector<std::vector<uint8_t>> frames;
    size_t rejected{0};  // Oversize frames dropped during this feed
  };

  explicit FrameReassembler(size_t max_frame_size = protocol::DEFAULT_MAX_FRAME_SIZE);

  Result feed(const uint8_t* data, size_t size);
  Result feed(const std::vector<uint8_t>& chunk) { return feed(chunk.data(), chunk.size()); }

  // Bytes held for the frame in progress
  [[nodiscard]] size_t buffered() const noexcept { return header_len_ + payload_.size(); }

  // True if a frame is partially received or an oversize frame is being skipped
  [[nodiscard]] bool in_progress() const noexcept { return buffered() > 0 || skip_remaining_ > 0; }

  void reset();

private:
  size_t max_frame_size_;

  uint8_t header_[protocol::FRAME_HEADER_SIZE]{};
  size_t header_len_{0};

  size_t expected_{0};
  std::vector<uint8_t> payload_;

  size_t skip_remaining_{0};
};

}  // namespace network
}  // namespace proximity
