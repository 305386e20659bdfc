// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include <vector>

namespace floodchain {
namespace validation {

class ValidationState;

// Outcome of fork selection between the local and a remote chain
enum class ChainChoice {
  LOCAL,  // keep the local chain
  REMOTE, // adopt the remote chain
  NONE,   // neither chain validates (state carries NO_VALID_CHAIN)
};

const char *ChainChoiceToString(ChainChoice choice);

// Longest-valid-chain fork choice
// Both chains are run through CheckChain() independently:
//   both valid   -> the longer one; equal length keeps LOCAL
//   one valid    -> that one
//   none valid   -> NONE, state set to NO_VALID_CHAIN
// When LOCAL wins because the remote chain failed, state carries the
// remote's rejection.
// Uniform per-block work makes length a proxy for accumulated work.
// Deterministic: every node makes the same choice for the same inputs.
ChainChoice SelectChain(const std::vector<CBlock> &local,
                        const std::vector<CBlock> &remote,
                        ValidationState &state);

} // namespace validation
} // namespace floodchain
