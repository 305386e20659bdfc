// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
//
// NetworkManager wiring with a recording transport. Most cases drive an
// external io_context by hand so posted work runs deterministically.

#include <catch2/catch.hpp>
#include "chain/chainparams.hpp"
#include "chain/chainstate_manager.hpp"
#include "network/gossip_handler.hpp"
#include "network/infra/mock_transport.hpp"
#include "network/message.hpp"
#include "network/network_manager.hpp"
#include "network/peer_membership.hpp"
#include "test_chain_helpers.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include <variant>

using namespace floodchain;
using namespace floodchain::network;
using namespace floodchain::message;

namespace {

class ManagerFixture {
public:
    explicit ManagerFixture(bool external_io = true, bool initial_sync = false) {
        gossip.local_id = "local";
        params = chain::ChainParams::Create();
        chainstate = std::make_unique<validation::ChainstateManager>(*params);
        REQUIRE(chainstate->Initialize());
        transport = std::make_shared<MockGossipTransport>();

        NetworkManager::Config config;
        config.initial_sync = initial_sync;
        config.initial_sync_delay = std::chrono::milliseconds(0);
        if (external_io) {
            config.io_threads = 0;
            io = std::make_shared<boost::asio::io_context>();
        }
        manager = std::make_unique<NetworkManager>(*chainstate, gossip, config, transport, io);
    }

    ~ManagerFixture() {
        manager->stop();
    }

    void Drain() {
        if (io) {
            io->restart();
            io->poll();
        }
    }

    GossipConfig gossip;
    std::unique_ptr<chain::ChainParams> params;
    std::unique_ptr<validation::ChainstateManager> chainstate;
    std::shared_ptr<MockGossipTransport> transport;
    std::shared_ptr<boost::asio::io_context> io;
    std::unique_ptr<NetworkManager> manager;
};

bool WaitForPublished(const MockGossipTransport& transport, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (transport.published_count() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return transport.published_count() == count;
}

} // namespace

TEST_CASE("NetworkManager - lifecycle", "[network_manager]") {
    ManagerFixture f;

    REQUIRE_FALSE(f.manager->is_running());
    REQUIRE(f.manager->start());
    REQUIRE(f.manager->is_running());
    REQUIRE(f.transport->is_running());
    REQUIRE(f.transport->get_subscriptions() == std::set<std::string>{"blocks", "chains"});

    SECTION("Second start is refused") {
        REQUIRE_FALSE(f.manager->start());
    }

    SECTION("Stop is idempotent") {
        f.manager->stop();
        f.manager->stop();
        REQUIRE_FALSE(f.manager->is_running());
        REQUIRE_FALSE(f.transport->is_running());
    }
}

TEST_CASE("NetworkManager - transport failure aborts start", "[network_manager]") {
    ManagerFixture f;
    f.transport->set_start_result(false);
    REQUIRE_FALSE(f.manager->start());
    REQUIRE_FALSE(f.manager->is_running());
}

TEST_CASE("NetworkManager - routes transport events to the handler", "[network_manager]") {
    ManagerFixture f;
    REQUIRE(f.manager->start());

    SECTION("Discovery updates the group") {
        f.transport->simulate_peer_event(PeerEvent::Kind::DISCOVERED, "alice", "10.0.0.1:9650");
        REQUIRE(f.manager->get_peers() == std::vector<std::string>{"alice"});
        REQUIRE(f.transport->get_group() == std::set<std::string>{"alice"});

        f.transport->simulate_peer_event(PeerEvent::Kind::EXPIRED, "alice", "10.0.0.1:9650");
        REQUIRE(f.manager->get_peers().empty());
    }

    SECTION("Inbound block reaches the ledger") {
        f.transport->simulate_message("blocks", "alice", EncodeBlock(test::KnownBlock1()));
        REQUIRE(f.chainstate->GetTip() == test::KnownBlock1());
    }

    SECTION("Traffic after stop is ignored") {
        f.manager->stop();
        f.transport->simulate_message("blocks", "alice", EncodeBlock(test::KnownBlock1()));
        f.transport->simulate_peer_event(PeerEvent::Kind::DISCOVERED, "alice", "10.0.0.1:9650");
        REQUIRE(f.chainstate->GetBlockCount() == 1);
        REQUIRE(f.manager->get_peers().empty());
    }
}

TEST_CASE("NetworkManager - request_chain", "[network_manager]") {
    ManagerFixture f;
    REQUIRE(f.manager->start());

    SECTION("No peers means nothing to ask") {
        REQUIRE_FALSE(f.manager->request_chain());
        f.Drain();
        REQUIRE(f.transport->published_count() == 0);
    }

    SECTION("Default target is the last known peer") {
        f.transport->simulate_peer_event(PeerEvent::Kind::DISCOVERED, "alice", "10.0.0.1:9650");
        f.transport->simulate_peer_event(PeerEvent::Kind::DISCOVERED, "bob", "10.0.0.2:9650");

        REQUIRE(f.manager->request_chain());
        REQUIRE(f.transport->published_count() == 0); // posted, not yet run
        f.Drain();

        auto published = f.transport->get_published();
        REQUIRE(published.size() == 1);
        REQUIRE(published[0].topic == "chains");
        REQUIRE(std::get<ChainRequest>(DecodeMessage(published[0].data)).from_peer_id == "bob");
    }

    SECTION("Explicit target") {
        REQUIRE(f.manager->request_chain("carol"));
        f.Drain();
        auto published = f.transport->get_published();
        REQUIRE(published.size() == 1);
        REQUIRE(std::get<ChainRequest>(DecodeMessage(published[0].data)).from_peer_id == "carol");
    }
}

TEST_CASE("NetworkManager - mined block hand-off", "[network_manager]") {
    ManagerFixture f;
    REQUIRE(f.manager->start());

    f.manager->submit_mined_block(test::KnownBlock1());
    REQUIRE(f.chainstate->GetBlockCount() == 1);
    f.Drain();

    REQUIRE(f.chainstate->GetTip() == test::KnownBlock1());
    auto published = f.transport->get_published();
    REQUIRE(published.size() == 1);
    REQUIRE(published[0].topic == "blocks");

    SECTION("Block that lost the race is not announced") {
        f.transport->clear_published();
        f.manager->submit_mined_block(test::KnownBlock1());
        f.Drain();
        REQUIRE(f.transport->published_count() == 0);
    }

    SECTION("broadcast_block announces without touching the ledger") {
        f.transport->clear_published();
        f.manager->broadcast_block(test::KnownBlock2());
        f.Drain();
        REQUIRE(f.transport->published_count() == 1);
        REQUIRE(f.chainstate->GetBlockCount() == 2);
    }
}

TEST_CASE("NetworkManager - initial sync", "[network_manager]") {
    ManagerFixture f(true, true);
    REQUIRE(f.manager->start());
    f.transport->simulate_peer_event(PeerEvent::Kind::DISCOVERED, "alice", "10.0.0.1:9650");

    f.io->run_for(std::chrono::milliseconds(200));

    auto published = f.transport->get_published();
    REQUIRE(published.size() == 1);
    REQUIRE(std::get<ChainRequest>(DecodeMessage(published[0].data)).from_peer_id == "alice");
}

TEST_CASE("NetworkManager - initial sync without peers sends nothing", "[network_manager]") {
    ManagerFixture f(true, true);
    REQUIRE(f.manager->start());

    f.io->run_for(std::chrono::milliseconds(200));
    REQUIRE(f.transport->published_count() == 0);
}

TEST_CASE("NetworkManager - owned io thread", "[network_manager]") {
    ManagerFixture f(false);
    REQUIRE(f.manager->start());

    f.manager->submit_mined_block(test::KnownBlock1());

    REQUIRE(WaitForPublished(*f.transport, 1));
    REQUIRE(f.chainstate->GetTip() == test::KnownBlock1());

    f.manager->stop();
    REQUIRE_FALSE(f.manager->is_running());
}

TEST_CASE("NetworkManager - owned io thread runs again after a restart", "[network_manager]") {
    ManagerFixture f(false);
    REQUIRE(f.manager->start());
    f.manager->stop();
    REQUIRE_FALSE(f.transport->is_running());

    REQUIRE(f.manager->start());
    REQUIRE(f.manager->is_running());
    REQUIRE(f.transport->is_running());

    // Only a live io thread can run the hand-off and publish the block
    f.manager->submit_mined_block(test::KnownBlock1());
    REQUIRE(WaitForPublished(*f.transport, 1));
    REQUIRE(f.chainstate->GetTip() == test::KnownBlock1());

    REQUIRE(f.manager->request_chain("alice"));
    REQUIRE(WaitForPublished(*f.transport, 2));
}
