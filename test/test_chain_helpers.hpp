// Copyright (c) 2025 The Unicity Foundation
// Test helpers for building validly mined ledgers

#ifndef FLOODCHAIN_TEST_CHAIN_HELPERS_HPP
#define FLOODCHAIN_TEST_CHAIN_HELPERS_HPP

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/miner.hpp"
#include "chain/pow.hpp"
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace floodchain {
namespace test {

// Base timestamp for mined test blocks; block n gets BASE_TIME + n
constexpr int64_t BASE_TIME = 1700000000;

inline const CBlock &Genesis() {
    static const CBlock genesis = chain::CreateGenesisBlock();
    return genesis;
}

// Pre-mined fixtures: genesis <- "hello" <- "world"
// The nonces are the first satisfying ones counting up from 0.
inline CBlock KnownBlock1() {
    CBlock block;
    block.nId = 1;
    block.hashPrevBlock = Genesis().hash;
    block.nTime = BASE_TIME + 1;
    block.data = "hello";
    block.nNonce = 12452;
    block.hash = "0000c9c6cf4001daa18ef5299f7f6decc0d521550b47e5994abcd24162787885";
    return block;
}

inline CBlock KnownBlock2() {
    CBlock block;
    block.nId = 2;
    block.hashPrevBlock = KnownBlock1().hash;
    block.nTime = BASE_TIME + 2;
    block.data = "world";
    block.nNonce = 88833;
    block.hash = "000059bdc51fa4d174a58c8ffe4c62315dd0b5096d012db33673f403ddb60f33";
    return block;
}

// Valid block on genesis whose data alone (70000 'x') is larger than any UDP
// datagram, so a ledger holding it has to travel over a stream
inline CBlock KnownLargeBlock1() {
    CBlock block;
    block.nId = 1;
    block.hashPrevBlock = Genesis().hash;
    block.nTime = BASE_TIME + 1;
    block.data = std::string(70000, 'x');
    block.nNonce = 60707;
    block.hash = "0000c1cc30509d3d381b8464c2cc0925fb987570cbec9a67d826e81425820fd4";
    return block;
}

/**
 * Mine a block on prev at the real difficulty.
 *
 * Results are memoized per (prev id, prev hash, data, timestamp) so tests that build
 * the same chain repeatedly pay for the nonce search once per run.
 */
inline CBlock MineNext(const CBlock &prev, const std::string &data, int64_t timestamp) {
    using Key = std::tuple<uint64_t, std::string, std::string, int64_t>;
    static std::mutex cache_mutex;
    static std::map<Key, CBlock> cache;

    Key key{prev.nId, prev.hash, data, timestamp};
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache.find(key);
        if (it != cache.end()) {
            return it->second;
        }
    }

    auto mined = mining::CPUMiner::MineBlock(prev, data, timestamp);
    if (!mined) {
        throw std::runtime_error("MineBlock gave up without a stop flag");
    }

    std::lock_guard<std::mutex> lock(cache_mutex);
    cache.emplace(key, *mined);
    return *mined;
}

inline CBlock MineNext(const CBlock &prev, const std::string &data) {
    return MineNext(prev, data, BASE_TIME + static_cast<int64_t>(prev.nId) + 1);
}

// [genesis, b1, ..., bn], each data field "<tag>-<id>"
inline std::vector<CBlock> BuildChain(size_t blocks_after_genesis,
                                      const std::string &tag = "block") {
    std::vector<CBlock> chain{Genesis()};
    for (size_t i = 0; i < blocks_after_genesis; ++i) {
        const CBlock &prev = chain.back();
        chain.push_back(MineNext(prev, tag + "-" + std::to_string(prev.nId + 1)));
    }
    return chain;
}

// Correctly linked and hashed, but without the difficulty prefix
inline CBlock BuildUnminedBlock(const CBlock &prev, const std::string &data) {
    CBlock block;
    block.nId = prev.nId + 1;
    block.hashPrevBlock = prev.hash;
    block.nTime = BASE_TIME + static_cast<int64_t>(block.nId);
    block.data = data;
    for (block.nNonce = 0;; ++block.nNonce) {
        auto digest = consensus::ComputeBlockHash(block.nId, block.nTime,
                                                  block.hashPrevBlock, block.data,
                                                  block.nNonce);
        if (!consensus::SatisfiesDifficulty(digest)) {
            block.hash = block.ComputeHash();
            return block;
        }
    }
}

} // namespace test
} // namespace floodchain

#endif // FLOODCHAIN_TEST_CHAIN_HELPERS_HPP
