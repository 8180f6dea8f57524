// Fuzz target for inbound frame reassembly
// Tests FrameReassembler::feed with arbitrary chunking and stream contents
//
// Link writes arrive from the remote peer in whatever chunk sizes it chooses.
// Bugs in this code can:
// - Exhaust memory (buffering beyond the configured maximum frame size)
// - Desynchronize the stream after an oversize frame
// - Crash the link layer (out-of-bounds reads on split headers)
//
// Target code: src/network/frame_codec.cpp

#include "network/frame_codec.hpp"
#include "network/protocol.hpp"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <vector>

using namespace proximity::network;
namespace protocol = proximity::protocol;

// FuzzInput: Parse structured fuzz data
class FuzzInput {
public:
    FuzzInput(const uint8_t *data, size_t size) : data_(data), size_(size), offset_(0) {}

    template<typename T>
    T read() {
        if (offset_ + sizeof(T) > size_) {
            return T{};
        }
        T value;
        memcpy(&value, data_ + offset_, sizeof(T));
        offset_ += sizeof(T);
        return value;
    }

    bool has_bytes(size_t n) const {
        return offset_ + n <= size_;
    }

    // Next chunk of at most max_len bytes
    std::vector<uint8_t> read_chunk(size_t max_len) {
        const size_t len = std::min(max_len, size_ - offset_);
        std::vector<uint8_t> chunk(data_ + offset_, data_ + offset_ + len);
        offset_ += len;
        return chunk;
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 3) return 0;

    FuzzInput input(data, size);

    // Small maximum so the oversize path is reached often
    const size_t max_frame_size = 1 + input.read<uint16_t>() % 512;
    FrameReassembler reassembler(max_frame_size);

    while (input.has_bytes(1)) {
        // Chunk length is drawn from the stream itself (1..64 bytes)
        const size_t chunk_len = 1 + input.read<uint8_t>() % 64;
        auto chunk = input.read_chunk(chunk_len);
        if (chunk.empty()) {
            break;
        }

        auto result = reassembler.feed(chunk);
        for (const auto& frame : result.frames) {
            if (frame.size() > max_frame_size) {
                abort();
            }
        }
        if (reassembler.buffered() > protocol::FRAME_HEADER_SIZE + max_frame_size) {
            abort();
        }
    }

    // Any chunking of a valid frame reassembles to the original payload
    FrameReassembler fresh(protocol::DEFAULT_MAX_FRAME_SIZE);
    std::vector<uint8_t> payload(data, data + std::min(size, protocol::DEFAULT_MAX_FRAME_SIZE));
    const auto frame = FrameCodec::encode(payload);
    const size_t mtu = 1 + data[0] % 32;

    std::vector<std::vector<uint8_t>> out;
    for (const auto& piece : FrameCodec::fragment(frame, mtu)) {
        if (piece.size() > mtu) {
            abort();
        }
        auto result = fresh.feed(piece);
        out.insert(out.end(), result.frames.begin(), result.frames.end());
    }
    if (out.size() != 1 || out[0] != payload || fresh.in_progress()) {
        abort();
    }

    return 0;
}
