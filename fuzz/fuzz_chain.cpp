// Fuzz target for fork selection
// The input is split at the first NUL byte into a local and a remote chain
// (JSON block arrays). SelectChain() must stay deterministic and never pick
// a chain that fails CheckChain().

#include "chain/block.hpp"
#include "chain/chain_selector.hpp"
#include "chain/validation.hpp"
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace {

std::vector<CBlock> ParseChain(const uint8_t *begin, const uint8_t *end) {
    nlohmann::json j = nlohmann::json::parse(begin, end, nullptr, false);
    if (j.is_discarded()) {
        return {};
    }
    auto chain = ChainFromJson(j);
    return chain ? *chain : std::vector<CBlock>{};
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace floodchain::validation;

    const uint8_t *end = data + size;
    const uint8_t *split = data;
    while (split != end && *split != 0) {
        ++split;
    }

    std::vector<CBlock> local = ParseChain(data, split);
    std::vector<CBlock> remote = split == end ? std::vector<CBlock>{}
                                              : ParseChain(split + 1, end);

    ValidationState state;
    ChainChoice choice = SelectChain(local, remote, state);

    ValidationState again_state;
    if (SelectChain(local, remote, again_state) != choice) {
        __builtin_trap();
    }

    ValidationState check;
    if (choice == ChainChoice::REMOTE && !CheckChain(remote, check)) {
        __builtin_trap();
    }
    if (choice == ChainChoice::NONE &&
        state.GetResult() != BlockValidationResult::NO_VALID_CHAIN) {
        __builtin_trap();
    }

    return 0;
}
