// Unit tests for protocol constants and peer identity
#include <catch2/catch.hpp>
#include "network/protocol.hpp"
#include "util/string_parsing.hpp"
#include <set>

using namespace floodchain;
using namespace floodchain::protocol;

TEST_CASE("GeneratePeerId", "[network][protocol]") {
    SECTION("Hex string of PEER_ID_BYTES bytes") {
        std::string id = network::GeneratePeerId();
        CHECK(id.size() == 2 * PEER_ID_BYTES);
        CHECK(util::ParseHex(id).has_value());
    }

    SECTION("Ids do not repeat") {
        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i) {
            ids.insert(network::GeneratePeerId());
        }
        CHECK(ids.size() == 100);
    }
}

TEST_CASE("GossipConfig defaults", "[network][protocol]") {
    network::GossipConfig config;
    CHECK(config.local_id.empty());
    CHECK(config.chain_topic == "chains");
    CHECK(config.block_topic == "blocks");
    CHECK(config.chain_topic != config.block_topic);
}

TEST_CASE("Protocol constants", "[network][protocol]") {
    CHECK(ports::GOSSIP != ports::DISCOVERY);
    CHECK(BEACON_INTERVAL < PEER_TTL);
    CHECK(FRAME_HEADER_SIZE == 8);
    CHECK(MAX_ENVELOPE_SIZE > 65507); // a ledger response does not have to fit a datagram
    CHECK(MAX_SEND_QUEUE_SIZE >= FRAME_HEADER_SIZE + MAX_ENVELOPE_SIZE);
    CHECK(protocol::GetUserAgent().find("Floodchain") != std::string::npos);
}
