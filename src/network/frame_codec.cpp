// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/frame_codec.hpp"

#include <algorithm>

namespace proximity {
namespace network {

std::vector<uint8_t> FrameCodec::encode(const std::vector<uint8_t>& payload) {
  const auto len = static_cast<uint16_t>(payload.size());

  std::vector<uint8_t> frame;
  frame.reserve(protocol::FRAME_HEADER_SIZE + payload.size());
  frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
  frame.push_back(static_cast<uint8_t>(len & 0xFF));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::vector<std::vector<uint8_t>> FrameCodec::fragment(const std::vector<uint8_t>& frame, size_t mtu) {
  std::vector<std::vector<uint8_t>> chunks;
  size_t offset = 0;
  while (offset < frame.size()) {
    const size_t n = chunk_size(frame.size(), offset, mtu);
    chunks.emplace_back(frame.begin() + static_cast<std::ptrdiff_t>(offset),
                        frame.begin() + static_cast<std::ptrdiff_t>(offset + n));
    offset += n;
  }
  return chunks;
}

size_t FrameCodec::chunk_size(size_t frame_size, size_t offset, size_t mtu) noexcept {
  if (offset >= frame_size) {
    return 0;
  }
  return std::min(frame_size - offset, std::max<size_t>(mtu, 1));
}

FrameReassembler::FrameReassembler(size_t max_frame_size) : max_frame_size_(max_frame_size) {}

FrameReassembler::Result FrameReassembler::feed(const uint8_t* data, size_t size) {
  Result result;
  size_t pos = 0;

  while (pos < size) {
    // Discard the body of a rejected frame
    if (skip_remaining_ > 0) {
      const size_t n = std::min(skip_remaining_, size - pos);
      skip_remaining_ -= n;
      pos += n;
      continue;
    }

    if (header_len_ < protocol::FRAME_HEADER_SIZE) {
      header_[header_len_++] = data[pos++];
      if (header_len_ < protocol::FRAME_HEADER_SIZE) {
        continue;
      }

      const size_t declared = (static_cast<size_t>(header_[0]) << 8) | header_[1];
      if (declared > max_frame_size_) {
        ++result.rejected;
        skip_remaining_ = declared;
        header_len_ = 0;
        continue;
      }

      expected_ = declared;
      payload_.clear();
      payload_.reserve(expected_);
      if (expected_ == 0) {
        result.frames.emplace_back();
        header_len_ = 0;
      }
      continue;
    }

    const size_t n = std::min(expected_ - payload_.size(), size - pos);
    payload_.insert(payload_.end(), data + pos, data + pos + n);
    pos += n;

    if (payload_.size() == expected_) {
      result.frames.push_back(std::move(payload_));
      payload_ = std::vector<uint8_t>();
      header_len_ = 0;
      expected_ = 0;
    }
  }

  return result;
}

void FrameReassembler::reset() {
  header_len_ = 0;
  expected_ = 0;
  payload_.clear();
  payload_.shrink_to_fit();
  skip_remaining_ = 0;
}

}  // namespace network
}  // namespace proximity
