// Fuzz target for gossip payload decoding
// Any byte string from the network must decode to exactly one message kind
// without throwing, and re-encoding a decoded message must be stable.

#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace floodchain::message;

    std::vector<uint8_t> payload(data, data + size);
    GossipMessage msg = DecodeMessage(payload);

    std::vector<uint8_t> encoded;
    if (auto *response = std::get_if<ChainResponse>(&msg)) {
        encoded = EncodeChainResponse(*response);
    } else if (auto *request = std::get_if<ChainRequest>(&msg)) {
        encoded = EncodeChainRequest(*request);
    } else if (auto *block = std::get_if<CBlock>(&msg)) {
        encoded = EncodeBlock(*block);
    } else {
        return 0;
    }

    // CRITICAL: our own encoding must decode to the same kind
    GossipMessage again = DecodeMessage(encoded);
    if (again.index() != msg.index()) {
        __builtin_trap();
    }

    // CRITICAL: encoding is deterministic
    if (std::holds_alternative<ChainRequest>(again) &&
        EncodeChainRequest(std::get<ChainRequest>(again)) != encoded) {
        __builtin_trap();
    }
    if (std::holds_alternative<CBlock>(again) &&
        EncodeBlock(std::get<CBlock>(again)) != encoded) {
        __builtin_trap();
    }

    return 0;
}
