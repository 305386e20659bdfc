// Copyright (c) 2025 The Unicity Foundation
// Unit tests for chain/validation.cpp - block and chain validation
//
// These tests verify:
// - Each rejection category and the order checks run in
// - Chain validation skips the genesis anchor
// - Any single-field mutation of a non-genesis block breaks the chain

#include <catch2/catch.hpp>
#include "chain/validation.hpp"
#include "test_chain_helpers.hpp"

using namespace floodchain;
using namespace floodchain::validation;

TEST_CASE("CheckBlock - valid successor", "[validation]") {
    ValidationState state;
    REQUIRE(CheckBlock(test::KnownBlock1(), test::Genesis(), state));
    REQUIRE(state.IsValid());
    REQUIRE(CheckBlock(test::KnownBlock2(), test::KnownBlock1(), state));
    REQUIRE(state.ToString() == "valid");

    // Block size does not matter to validation
    REQUIRE(CheckBlock(test::KnownLargeBlock1(), test::Genesis(), state));
    REQUIRE(test::KnownLargeBlock1().data.size() == 70000);
}

TEST_CASE("CheckBlock - rejection categories", "[validation]") {
    ValidationState state;

    SECTION("Wrong previous hash is a broken link") {
        REQUIRE_FALSE(CheckBlock(test::KnownBlock2(), test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::BROKEN_LINK);
        REQUIRE(state.GetRejectReason() == "bad-prevblk");
    }

    SECTION("Unmined block lacks work") {
        CBlock block = test::BuildUnminedBlock(test::Genesis(), "cheap");
        REQUIRE_FALSE(CheckBlock(block, test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::INSUFFICIENT_WORK);
    }

    SECTION("Skipped id is out of sequence") {
        // Linked to genesis and properly mined, but carrying id 2
        CBlock fake_prev = test::Genesis();
        fake_prev.nId = 1;
        CBlock block = test::MineNext(fake_prev, "skip");
        REQUIRE(block.nId == 2);
        REQUIRE(block.hashPrevBlock == test::Genesis().hash);

        REQUIRE_FALSE(CheckBlock(block, test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::OUT_OF_SEQUENCE);
        REQUIRE(state.GetRejectReason() == "bad-sequence");
    }

    SECTION("Content edited after mining is a hash mismatch") {
        CBlock block = test::KnownBlock1();
        block.data = "tampered";
        REQUIRE_FALSE(CheckBlock(block, test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::HASH_MISMATCH);
        REQUIRE(state.GetRejectReason() == "bad-hash");
    }

    SECTION("Malformed hash is an encoding failure") {
        CBlock block = test::KnownBlock1();
        block.hash = "not-hex";
        REQUIRE_FALSE(CheckBlock(block, test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::INVALID_ENCODING);
    }

    SECTION("Link is checked before work") {
        CBlock block = test::BuildUnminedBlock(test::KnownBlock1(), "both wrong");
        REQUIRE_FALSE(CheckBlock(block, test::Genesis(), state));
        REQUIRE(state.GetResult() == BlockValidationResult::BROKEN_LINK);
    }
}

TEST_CASE("CheckChain - trivial chains", "[validation]") {
    ValidationState state;
    REQUIRE(CheckChain({}, state));
    REQUIRE(CheckChain({test::Genesis()}, state));

    // Index 0 is never checked, whatever it holds
    CBlock bogus_anchor = test::Genesis();
    bogus_anchor.hash = "xyz";
    REQUIRE(CheckChain({bogus_anchor}, state));
}

TEST_CASE("CheckChain - valid chain", "[validation]") {
    ValidationState state;
    REQUIRE(CheckChain({test::Genesis(), test::KnownBlock1(), test::KnownBlock2()}, state));
    REQUIRE(CheckChain(test::BuildChain(3), state));
}

TEST_CASE("CheckChain - any single mutation breaks it", "[validation]") {
    const std::vector<CBlock> chain{test::Genesis(), test::KnownBlock1(), test::KnownBlock2()};

    for (size_t i = 1; i < chain.size(); ++i) {
        INFO("mutating index " << i);

        SECTION("flip one bit of data at " + std::to_string(i)) {
            auto mutated = chain;
            mutated[i].data[0] ^= 0x01;
            ValidationState state;
            REQUIRE_FALSE(CheckChain(mutated, state));
            REQUIRE(state.GetDebugMessage().rfind("index " + std::to_string(i) + ":", 0) == 0);
        }

        SECTION("increment nonce at " + std::to_string(i)) {
            auto mutated = chain;
            mutated[i].nNonce++;
            ValidationState state;
            REQUIRE_FALSE(CheckChain(mutated, state));
        }

        SECTION("change previous_hash at " + std::to_string(i)) {
            auto mutated = chain;
            mutated[i].hashPrevBlock[5] = mutated[i].hashPrevBlock[5] == 'a' ? 'b' : 'a';
            ValidationState state;
            REQUIRE_FALSE(CheckChain(mutated, state));
            REQUIRE(state.GetResult() == BlockValidationResult::BROKEN_LINK);
        }
    }
}

TEST_CASE("CheckChain - reports the first failing index", "[validation]") {
    auto chain = std::vector<CBlock>{test::Genesis(), test::KnownBlock1(), test::KnownBlock2()};
    chain[2].data = "edited";

    ValidationState state;
    REQUIRE_FALSE(CheckChain(chain, state));
    REQUIRE(state.GetResult() == BlockValidationResult::HASH_MISMATCH);
    REQUIRE(state.GetDebugMessage().rfind("index 2:", 0) == 0);
    REQUIRE(state.ToString().rfind("bad-hash: index 2:", 0) == 0);
}
