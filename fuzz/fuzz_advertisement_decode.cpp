// Fuzz target for advertisement payload decoding
// Tests AdvertisementCodec::decode and has_service_prefix
//
// Advertisement payloads come from any device in radio range, so decode()
// sees fully attacker-controlled bytes. Bugs in this code can:
// - Crash the scanner (out-of-bounds reads, exception leaks through noexcept)
// - Let a neighbour inflate per-peer memory (unbounded service data)
// - Desynchronize capability state (non-deterministic decoding)
//
// Target code: src/network/advertisement.cpp

#include "network/advertisement.hpp"
#include "network/protocol.hpp"
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

    std::vector<uint8_t> remaining() const {
        if (offset_ >= size_) return {};
        return std::vector<uint8_t>(data_ + offset_, data_ + size_);
    }

private:
    const uint8_t *data_;
    size_t size_;
    size_t offset_;
};

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    FuzzInput input(data, size);

    // Half the runs filter for the real service id so the flags path is reached
    const uint8_t selector = input.read<uint8_t>();
    const uint16_t fuzzed_id = input.read<uint16_t>();
    const uint16_t service_id = (selector & 1) ? protocol::services::CHAT : fuzzed_id;
    const std::vector<uint8_t> payload = input.remaining();

    auto caps = AdvertisementCodec::decode(payload, service_id);
    const bool has_prefix = AdvertisementCodec::has_service_prefix(payload, service_id);

    if (caps) {
        // A decode implies the prefix matched and a header was present
        if (!has_prefix || payload.size() < protocol::ADVERTISEMENT_HEADER_SIZE) {
            abort();
        }
        if (caps->service_data.size() > protocol::MAX_SERVICE_DATA_SIZE) {
            abort();
        }

        // Determinism: decoding twice yields the same capabilities
        auto again = AdvertisementCodec::decode(payload.data(), payload.size(), service_id);
        if (!again || *again != *caps) {
            abort();
        }

        // Re-encoding a decoded set stays within the broadcast limit and
        // decodes back to the same set (reserved flag bits are dropped)
        auto encoded = AdvertisementCodec::encode(*caps, service_id);
        if (encoded.size() > protocol::MAX_ADVERTISEMENT_SIZE) {
            abort();
        }
        auto round = AdvertisementCodec::decode(encoded, service_id);
        if (!round || *round != *caps) {
            abort();
        }
    } else if (has_prefix && payload.size() >= protocol::ADVERTISEMENT_HEADER_SIZE) {
        // Any header with a matching prefix must decode
        abort();
    }

    // Null data never decodes
    if (AdvertisementCodec::decode(nullptr, size, service_id)) {
        abort();
    }

    return 0;
}
