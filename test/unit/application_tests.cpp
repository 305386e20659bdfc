// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch.hpp>
#include "application.hpp"
#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "test_chain_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace floodchain;
using namespace floodchain::app;

namespace {

struct TempDatadir {
    std::filesystem::path path;

    explicit TempDatadir(const std::string& name) {
        path = std::filesystem::temp_directory_path() / ("floodchain_app_" + name);
        std::filesystem::remove_all(path);
    }
    ~TempDatadir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

AppConfig TestConfig(const std::filesystem::path& datadir) {
    AppConfig config;
    config.datadir = datadir;
    config.interactive = false;
    config.network_config.initial_sync = false;
    config.network_config.transport.listen_port = 0;
    config.network_config.transport.multicast_discovery = false;
    config.network_config.transport.discovery_port = 0;
    config.network_config.transport.bind_address = "127.0.0.1";
    return config;
}

} // namespace

TEST_CASE("Application - initialize", "[application]") {
    TempDatadir tmp("init");

    SECTION("Fresh datadir starts from genesis") {
        Application app(TestConfig(tmp.path));
        REQUIRE(app.initialize());
        REQUIRE(std::filesystem::is_directory(tmp.path));
        REQUIRE(app.chainstate_manager().GetChain() == std::vector<CBlock>{test::Genesis()});
        REQUIRE(app.gossip_config().local_id.size() == 2 * protocol::PEER_ID_BYTES);
    }

    SECTION("Saved ledger is loaded") {
        std::filesystem::create_directories(tmp.path);
        auto params = chain::ChainParams::Create();
        validation::ChainstateManager saved(*params);
        REQUIRE(saved.Initialize());
        validation::ValidationState state;
        REQUIRE(saved.AcceptBlock(test::KnownBlock1(), state));
        REQUIRE(saved.Save((tmp.path / "ledger.json").string()));

        Application app(TestConfig(tmp.path));
        REQUIRE(app.initialize());
        REQUIRE(app.chainstate_manager().GetTip() == test::KnownBlock1());
    }

    SECTION("Unusable ledger falls back to genesis") {
        std::filesystem::create_directories(tmp.path);
        std::ofstream(tmp.path / "ledger.json") << "{ definitely not a ledger";

        Application app(TestConfig(tmp.path));
        REQUIRE(app.initialize());
        REQUIRE(app.chainstate_manager().GetBlockCount() == 1);
    }
}

TEST_CASE("Application - each node gets its own peer id", "[application]") {
    TempDatadir tmp("ids");
    Application a(TestConfig(tmp.path));
    Application b(TestConfig(tmp.path));
    REQUIRE(a.gossip_config().local_id != b.gossip_config().local_id);
}

TEST_CASE("Application - operator commands", "[application]") {
    TempDatadir tmp("commands");
    Application app(TestConfig(tmp.path));
    REQUIRE(app.initialize());
    std::ostringstream out;

    SECTION("ls p with no peers") {
        REQUIRE(app.execute_command("ls p", out));
        REQUIRE(out.str().find("Discovered peers: 0") != std::string::npos);
    }

    SECTION("ls c prints the ledger") {
        REQUIRE(app.execute_command("ls c", out));
        REQUIRE(out.str().find(test::Genesis().hash) != std::string::npos);
        REQUIRE(out.str().find("\"previous_hash\"") != std::string::npos);
    }

    SECTION("req without peers") {
        REQUIRE_FALSE(app.execute_command("req", out));
        REQUIRE(out.str().find("no peers") != std::string::npos);
    }

    SECTION("create b needs data") {
        REQUIRE_FALSE(app.execute_command("create b", out));
        REQUIRE(out.str().find("usage") != std::string::npos);
    }

    SECTION("create b starts the miner") {
        REQUIRE(app.execute_command("create b hello world", out));
        REQUIRE(out.str().find("mining block with data: hello world") != std::string::npos);
        app.miner().Stop();
    }

    SECTION("help") {
        REQUIRE(app.execute_command("help", out));
        REQUIRE(out.str().find("create b <data>") != std::string::npos);
    }

    SECTION("blank line is a no-op") {
        REQUIRE(app.execute_command("   ", out));
        REQUIRE(out.str().empty());
    }

    SECTION("quit requests shutdown") {
        REQUIRE_FALSE(app.shutdown_requested());
        REQUIRE(app.execute_command("quit", out));
        REQUIRE(app.shutdown_requested());
    }

    SECTION("unknown command") {
        REQUIRE_FALSE(app.execute_command("ls x", out));
        REQUIRE_FALSE(app.execute_command("frobnicate", out));
        REQUIRE(out.str().find("unknown command") != std::string::npos);
    }
}
