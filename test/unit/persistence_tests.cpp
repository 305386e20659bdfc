// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "test_chain_helpers.hpp"
#include "util/files.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

using namespace floodchain;
using namespace floodchain::validation;
using json = nlohmann::json;

namespace {

struct TempLedgerFile {
    std::filesystem::path dir;
    std::filesystem::path file;

    explicit TempLedgerFile(const std::string& name) {
        dir = std::filesystem::temp_directory_path() / ("floodchain_persist_" + name);
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        file = dir / "ledger.json";
    }
    ~TempLedgerFile() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

void WriteLedger(const std::filesystem::path& path, const json& root) {
    REQUIRE(util::atomic_write_file(path, root.dump()));
}

} // namespace

TEST_CASE("Ledger persistence - round trip", "[persistence][chain]") {
    TempLedgerFile tmp("roundtrip");
    auto params = chain::ChainParams::Create();

    SECTION("Genesis only") {
        ChainstateManager cs1(*params);
        REQUIRE(cs1.Initialize());
        REQUIRE(cs1.Save(tmp.file.string()));
        REQUIRE(std::filesystem::exists(tmp.file));

        ChainstateManager cs2(*params);
        REQUIRE(cs2.Load(tmp.file.string()));
        REQUIRE(cs2.GetChain() == cs1.GetChain());
    }

    SECTION("Chain with mined blocks") {
        ChainstateManager cs1(*params);
        REQUIRE(cs1.Initialize());
        ValidationState state;
        REQUIRE(cs1.AcceptBlock(test::KnownBlock1(), state));
        REQUIRE(cs1.AcceptBlock(test::KnownBlock2(), state));
        REQUIRE(cs1.Save(tmp.file.string()));

        ChainstateManager cs2(*params);
        REQUIRE(cs2.Load(tmp.file.string()));
        REQUIRE(cs2.GetBlockCount() == 3);
        REQUIRE(cs2.GetTip() == test::KnownBlock2());
    }

    SECTION("File layout") {
        ChainstateManager cs(*params);
        REQUIRE(cs.Initialize());
        ValidationState state;
        REQUIRE(cs.AcceptBlock(test::KnownBlock1(), state));
        REQUIRE(cs.Save(tmp.file.string()));

        auto text = util::read_file_string(tmp.file);
        REQUIRE(text.has_value());
        auto root = json::parse(*text);
        REQUIRE(root["version"] == 1);
        REQUIRE(root["block_count"] == 2);
        REQUIRE(root["blocks"].size() == 2);
        REQUIRE(root["blocks"][1]["data"] == "hello");
    }

    SECTION("Save overwrites an older ledger") {
        ChainstateManager cs1(*params);
        REQUIRE(cs1.Initialize());
        REQUIRE(cs1.Save(tmp.file.string()));
        ValidationState state;
        REQUIRE(cs1.AcceptBlock(test::KnownBlock1(), state));
        REQUIRE(cs1.Save(tmp.file.string()));

        ChainstateManager cs2(*params);
        REQUIRE(cs2.Load(tmp.file.string()));
        REQUIRE(cs2.GetBlockCount() == 2);
    }
}

TEST_CASE("Ledger persistence - rejected files", "[persistence][chain]") {
    TempLedgerFile tmp("rejected");
    auto params = chain::ChainParams::Create();
    ChainstateManager cs(*params);

    auto good_root = [] {
        json root;
        root["version"] = 1;
        root["block_count"] = 2;
        root["blocks"] = ChainToJson({test::Genesis(), test::KnownBlock1()});
        return root;
    };

    SECTION("Missing file") {
        REQUIRE_FALSE(cs.Load((tmp.dir / "absent.json").string()));
        REQUIRE(cs.GetBlockCount() == 0);
    }

    SECTION("Not JSON") {
        REQUIRE(util::atomic_write_file(tmp.file, "this is not json"));
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Not an object") {
        WriteLedger(tmp.file, json::array());
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Wrong version") {
        auto root = good_root();
        root["version"] = 2;
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Missing version") {
        auto root = good_root();
        root.erase("version");
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Missing blocks") {
        auto root = good_root();
        root.erase("blocks");
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Empty blocks") {
        auto root = good_root();
        root["blocks"] = json::array();
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Malformed block") {
        auto root = good_root();
        root["blocks"][1].erase("nonce");
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Foreign genesis") {
        CBlock foreign = test::Genesis();
        foreign.data = "another network";
        auto root = good_root();
        root["blocks"][0] = BlockToJson(foreign);
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Chain that fails validation") {
        CBlock tampered = test::KnownBlock1();
        tampered.data = "edited on disk";
        auto root = good_root();
        root["blocks"][1] = BlockToJson(tampered);
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
    }

    SECTION("Failed load keeps the current ledger") {
        REQUIRE(cs.Initialize());
        auto root = good_root();
        root["version"] = 99;
        WriteLedger(tmp.file, root);
        REQUIRE_FALSE(cs.Load(tmp.file.string()));
        REQUIRE(cs.GetChain() == std::vector<CBlock>{test::Genesis()});
    }

    SECTION("Well-formed file loads") {
        WriteLedger(tmp.file, good_root());
        REQUIRE(cs.Load(tmp.file.string()));
        REQUIRE(cs.GetTip() == test::KnownBlock1());
    }
}
