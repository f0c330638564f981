// Copyright (c) 2024 The pbapclient developers
// Unit tests for peer identity, SDP records and enum strings

#include <catch2/catch_test_macros.hpp>
#include "client/connection_state.hpp"
#include "client/event.hpp"
#include "client/peer_device.hpp"
#include "client/sdp_record.hpp"

using namespace pbapclient::client;

TEST_CASE("PeerDevice - address parsing", "[client][peer][unit]") {
    SECTION("Valid addresses") {
        REQUIRE(PeerDevice::IsValidAddress("00:11:22:33:44:55"));
        REQUIRE(PeerDevice::IsValidAddress("aa:bb:cc:dd:ee:ff"));
    }

    SECTION("Invalid addresses") {
        REQUIRE_FALSE(PeerDevice::IsValidAddress(""));
        REQUIRE_FALSE(PeerDevice::IsValidAddress("00:11:22:33:44"));
        REQUIRE_FALSE(PeerDevice::IsValidAddress("00:11:22:33:44:55:66"));
        REQUIRE_FALSE(PeerDevice::IsValidAddress("00-11-22-33-44-55"));
        REQUIRE_FALSE(PeerDevice::IsValidAddress("0G:11:22:33:44:55"));
        REQUIRE_FALSE(PeerDevice::FromString("not-an-address").has_value());
    }

    SECTION("Normalized to upper case") {
        auto device = PeerDevice::FromString("aa:bb:cc:dd:ee:ff", "Car kit");
        REQUIRE(device.has_value());
        REQUIRE(device->address() == "AA:BB:CC:DD:EE:FF");
        REQUIRE(device->name() == "Car kit");
    }

    SECTION("Equality ignores case and name") {
        auto lower = PeerDevice::FromString("aa:bb:cc:dd:ee:ff", "one");
        auto upper = PeerDevice::FromString("AA:BB:CC:DD:EE:FF", "two");
        auto other = PeerDevice::FromString("AA:BB:CC:DD:EE:00");
        REQUIRE(*lower == *upper);
        REQUIRE(*lower != *other);
    }

    SECTION("Log string masks the middle octets") {
        auto device = PeerDevice::FromString("00:11:22:33:44:55");
        REQUIRE(device->ToLogString() == "00:XX:XX:XX:XX:55");
    }
}

TEST_CASE("SdpPseRecord - repository paths", "[client][sdp][unit]") {
    SdpPseRecord record;

    SECTION("No repositories means local phonebook") {
        auto paths = RepositoryPaths(record);
        std::vector<std::string> expected = {"telecom/pb.vcf", "telecom/ich.vcf",
                                             "telecom/och.vcf", "telecom/mch.vcf"};
        REQUIRE(paths == expected);
    }

    SECTION("Favorites only skips call history") {
        record.supported_repositories = repository::FAVORITES;
        REQUIRE(RepositoryPaths(record) == std::vector<std::string>{"telecom/fav.vcf"});
    }

    SECTION("Everything") {
        record.supported_repositories = repository::LOCAL_PHONEBOOK | repository::SIM_CARD |
                                        repository::SPEED_DIAL | repository::FAVORITES;
        std::vector<std::string> expected = {"telecom/pb.vcf", "SIM1/telecom/pb.vcf",
                                             "telecom/fav.vcf", "telecom/spd.vcf",
                                             "telecom/ich.vcf", "telecom/och.vcf",
                                             "telecom/mch.vcf"};
        REQUIRE(RepositoryPaths(record) == expected);
    }

    SECTION("Absent channels default to -1") {
        REQUIRE(record.l2cap_psm == -1);
        REQUIRE(record.rfcomm_channel == -1);
    }
}

TEST_CASE("Enum strings", "[client][unit]") {
    REQUIRE(ConnectionStateAsString(ConnectionState::DISCONNECTED) == "disconnected");
    REQUIRE(ConnectionStateAsString(ConnectionState::CONNECTING) == "connecting");
    REQUIRE(ConnectionStateAsString(ConnectionState::CONNECTED) == "connected");
    REQUIRE(ConnectionStateAsString(ConnectionState::DISCONNECTING) == "disconnecting");

    REQUIRE(EventTypeAsString(EventType::CONNECT) == "CONNECT");
    REQUIRE(EventTypeAsString(EventType::DISCONNECT_TIMEOUT) == "DISCONNECT_TIMEOUT");

    auto ev = Event::FromWorker(EventType::WORKER_CLOSED, 7);
    REQUIRE(ev.type == EventType::WORKER_CLOSED);
    REQUIRE(ev.attempt == 7);
    REQUIRE_FALSE(ev.synthesized);
    REQUIRE_FALSE(ev.peer.has_value());
}
