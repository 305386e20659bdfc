// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

// CBlock - One ledger entry
// - hash is the lower-case hex SHA-256 of the other five fields
//   (see consensus::ComputeBlockHash)
// - hashPrevBlock is the predecessor's hash, or "genesis" for block 0
// - nTime is informational only and never checked against the wall clock
// - data is an opaque payload
class CBlock
{
public:
    uint64_t nId{0};
    std::string hash;
    std::string hashPrevBlock;
    int64_t nTime{0};
    std::string data;
    uint64_t nNonce{0};

    // Sentinel stored in hashPrevBlock of the genesis block
    static constexpr const char* GENESIS_PREV_HASH = "genesis";

    // Recompute the content hash from id, time, prev hash, data and nonce
    [[nodiscard]] std::string ComputeHash() const;

    // Short form used in log lines: "#<id> <first 16 hash chars>"
    [[nodiscard]] std::string ToShortString() const;

    // Human-readable string
    [[nodiscard]] std::string ToString() const;

    bool operator==(const CBlock& other) const = default;
};

// JSON wire shape: {id, hash, previous_hash, timestamp, data, nonce}
nlohmann::json BlockToJson(const CBlock& block);

// Strict parse of the JSON wire shape. Every field must be present with the
// right type (id and nonce non-negative integers). Unknown fields are ignored.
std::optional<CBlock> BlockFromJson(const nlohmann::json& j);

nlohmann::json ChainToJson(const std::vector<CBlock>& chain);

// Fails if j is not an array or any element fails BlockFromJson
std::optional<std::vector<CBlock>> ChainFromJson(const nlohmann::json& j);
