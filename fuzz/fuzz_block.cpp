// Fuzz target for block parsing and validation
// Untrusted block JSON goes through BlockFromJson() and then CheckBlock()
// against genesis; neither may crash or throw.

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/validation.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace floodchain;

    static const CBlock genesis = chain::CreateGenesisBlock();

    nlohmann::json j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) {
        return 0;
    }

    auto block = BlockFromJson(j);
    if (!block) {
        return 0;
    }

    validation::ValidationState state;
    bool valid = validation::CheckBlock(*block, genesis, state);

    // CRITICAL: verdict and state must agree
    if (valid != state.IsValid()) {
        __builtin_trap();
    }

    // CRITICAL: an accepted block must hash to itself
    if (valid && block->ComputeHash() != block->hash) {
        __builtin_trap();
    }

    return 0;
}
