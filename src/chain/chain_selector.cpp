// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_selector.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

namespace floodchain {
namespace validation {

const char *ChainChoiceToString(ChainChoice choice) {
  switch (choice) {
  case ChainChoice::LOCAL:
    return "local";
  case ChainChoice::REMOTE:
    return "remote";
  case ChainChoice::NONE:
    return "none";
  }
  return "unknown";
}

ChainChoice SelectChain(const std::vector<CBlock> &local,
                        const std::vector<CBlock> &remote,
                        ValidationState &state) {
  ValidationState local_state;
  ValidationState remote_state;
  const bool local_valid = CheckChain(local, local_state);
  const bool remote_valid = CheckChain(remote, remote_state);

  if (local_valid && remote_valid) {
    if (local.size() >= remote.size()) {
      LOG_CHAIN_TRACE("Fork choice: keeping local chain (local={}, remote={})",
                      local.size(), remote.size());
      return ChainChoice::LOCAL;
    }
    LOG_CHAIN_TRACE("Fork choice: remote chain is longer (local={}, remote={})",
                    local.size(), remote.size());
    return ChainChoice::REMOTE;
  }

  if (remote_valid) {
    LOG_CHAIN_WARN("Fork choice: local chain invalid ({}), taking remote",
                   local_state.ToString());
    return ChainChoice::REMOTE;
  }

  if (local_valid) {
    LOG_CHAIN_DEBUG("Fork choice: remote chain invalid ({})", remote_state.ToString());
    state = remote_state;
    return ChainChoice::LOCAL;
  }

  state.Invalid(BlockValidationResult::NO_VALID_CHAIN, "no-valid-chain",
                "local: " + local_state.ToString() +
                    "; remote: " + remote_state.ToString());
  return ChainChoice::NONE;
}

} // namespace validation
} // namespace floodchain
