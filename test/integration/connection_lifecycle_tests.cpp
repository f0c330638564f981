// Copyright (c) 2024 The pbapclient developers
// End-to-end connection lifecycle tests
//
// Real PbapClientStateMachine on its own loop thread, real ConnectionHandler
// workers on their handler threads, persistent AccountStore. Only the
// discovery stack and the session I/O are mocked.

#include <catch2/catch_test_macros.hpp>
#include "client/account_store.hpp"
#include "client/connection_handler.hpp"
#include "client/state_machine.hpp"
#include "infra/mock_discovery.hpp"
#include "infra/mock_profile_session.hpp"
#include "infra/test_helpers.hpp"
#include <chrono>
#include <filesystem>
#include <memory>

using namespace pbapclient;
using namespace pbapclient::client;
using namespace pbapclient::test;
using namespace std::chrono_literals;

namespace {

class LifecycleFixture {
public:
    std::string test_dir;
    std::shared_ptr<MockDiscovery> discovery = std::make_shared<MockDiscovery>();
    std::shared_ptr<MockSessionState> session = std::make_shared<MockSessionState>();
    std::shared_ptr<AccountStore> accounts;
    ConnectionNotifications notifications;
    TransitionRecorder recorder{notifications};
    std::unique_ptr<PbapClientStateMachine> sm;

    PeerDevice device_a = Device("00:11:22:33:44:55");
    PeerDevice device_b = Device("66:77:88:99:AA:BB");

    LifecycleFixture() {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        test_dir = "/tmp/pbapclient_lifecycle_test_" + std::to_string(now);
        std::filesystem::create_directory(test_dir);
        accounts = std::make_shared<AccountStore>(test_dir);
        session->entries = {{"telecom/pb.vcf", 120},
                            {"telecom/ich.vcf", 10},
                            {"telecom/och.vcf", 8},
                            {"telecom/mch.vcf", 2}};
    }

    ~LifecycleFixture() {
        sm.reset();
        std::filesystem::remove_all(test_dir);
    }

    void Start(const ClientConfig& config = ClientConfig()) {
        sm = std::make_unique<PbapClientStateMachine>(
            config, discovery,
            ConnectionHandler::MakeFactory(MakeSessionFactory(session), accounts),
            notifications, accounts);
    }

    // State reached and its notification delivered
    bool WaitState(ConnectionState state, std::chrono::milliseconds timeout = 2000ms) {
        return WaitFor([&] {
            if (sm->GetConnectionState() != state) return false;
            auto all = recorder.All();
            return !all.empty() && all.back().next == state;
        }, timeout);
    }

    bool WaitSearching(const PeerDevice& device) {
        return WaitFor([&] { return discovery->IsSearching(device); });
    }
};

} // namespace

TEST_CASE("Lifecycle - connect, download, disconnect", "[client][integration]") {
    LifecycleFixture f;
    f.Start();

    f.sm->Connect(f.device_a);
    REQUIRE(f.WaitSearching(f.device_a));
    REQUIRE(f.discovery->Deliver(MakePseResult(f.device_a)));

    REQUIRE(f.WaitState(ConnectionState::CONNECTED));
    REQUIRE(f.recorder.Contains({f.device_a.address(), ConnectionState::DISCONNECTED,
                                 ConnectionState::CONNECTING}));
    REQUIRE(f.recorder.Contains({f.device_a.address(), ConnectionState::CONNECTING,
                                 ConnectionState::CONNECTED}));

    // Download runs on the handler thread after CONNECTED
    REQUIRE(WaitFor([&] { return f.session->Downloaded().size() == 4; }));
    REQUIRE(f.accounts->HasAccount(f.device_a));

    f.sm->Disconnect(f.device_a);
    REQUIRE(f.WaitState(ConnectionState::DISCONNECTED));
    REQUIRE(f.session->Count("disconnect") == 1);
    REQUIRE_FALSE(f.accounts->HasAccount(f.device_a));
    REQUIRE_FALSE(f.sm->GetDevice().has_value());

    auto transitions = f.recorder.All();
    REQUIRE(transitions.size() == 4);
    REQUIRE(transitions[2] == Transition{f.device_a.address(), ConnectionState::CONNECTED,
                                         ConnectionState::DISCONNECTING});
    REQUIRE(transitions[3] == Transition{f.device_a.address(), ConnectionState::DISCONNECTING,
                                         ConnectionState::DISCONNECTED});
}

TEST_CASE("Lifecycle - no discovery response", "[client][integration]") {
    LifecycleFixture f;
    ClientConfig config;
    config.connect_timeout = 100ms;
    f.Start(config);

    f.sm->Connect(f.device_a);
    REQUIRE(f.WaitSearching(f.device_a));

    // Connect timer fires, the handler tears down and reports closed
    REQUIRE(f.WaitState(ConnectionState::DISCONNECTED));
    auto transitions = f.recorder.All();
    REQUIRE(transitions.size() == 3);
    REQUIRE(transitions[0].next == ConnectionState::CONNECTING);
    REQUIRE(transitions[1] == Transition{f.device_a.address(), ConnectionState::CONNECTING,
                                         ConnectionState::DISCONNECTING});
    REQUIRE(transitions[2] == Transition{f.device_a.address(), ConnectionState::DISCONNECTING,
                                         ConnectionState::DISCONNECTED});
    REQUIRE_FALSE(f.discovery->IsSearching(f.device_a));
    REQUIRE(f.session->Count("connect") == 0);
}

TEST_CASE("Lifecycle - handshake failure", "[client][integration]") {
    LifecycleFixture f;
    f.session->connect_result = false;
    f.Start();

    f.sm->Connect(f.device_a);
    REQUIRE(f.WaitSearching(f.device_a));
    f.discovery->Deliver(MakePseResult(f.device_a));

    REQUIRE(f.WaitState(ConnectionState::DISCONNECTED));
    REQUIRE(f.recorder.Contains({f.device_a.address(), ConnectionState::CONNECTING,
                                 ConnectionState::DISCONNECTING}));
    REQUIRE_FALSE(f.recorder.Contains({f.device_a.address(), ConnectionState::CONNECTING,
                                       ConnectionState::CONNECTED}));
}

TEST_CASE("Lifecycle - connect to another device while disconnecting", "[client][integration]") {
    LifecycleFixture f;
    // Teardown stays stuck until the forced abort
    f.session->hang_on_disconnect = true;
    ClientConfig config;
    config.disconnect_timeout = 200ms;
    f.Start(config);

    f.sm->Connect(f.device_a);
    REQUIRE(f.WaitSearching(f.device_a));
    f.discovery->Deliver(MakePseResult(f.device_a));
    REQUIRE(f.WaitState(ConnectionState::CONNECTED));

    f.sm->Disconnect(f.device_a);
    REQUIRE(f.WaitState(ConnectionState::DISCONNECTING));
    f.sm->Connect(f.device_b);
    REQUIRE(WaitFor([&] { return f.sm->DeferredCount() == 1; }));
    REQUIRE(f.sm->GetDevice() == f.device_a);

    // Disconnect timeout forces the abort; the deferred connect follows
    REQUIRE(WaitFor([&] { return f.recorder.Size() == 5; }));
    REQUIRE(f.sm->GetDevice() == f.device_b);
    REQUIRE(f.session->Aborted());

    auto transitions = f.recorder.All();
    REQUIRE(transitions.size() == 5);
    REQUIRE(transitions[3] == Transition{f.device_a.address(), ConnectionState::DISCONNECTING,
                                         ConnectionState::DISCONNECTED});
    REQUIRE(transitions[4] == Transition{f.device_b.address(), ConnectionState::DISCONNECTED,
                                         ConnectionState::CONNECTING});
    REQUIRE(f.sm->DeferredCount() == 0);
}

TEST_CASE("Lifecycle - shutdown while connected", "[client][integration]") {
    LifecycleFixture f;
    f.Start();

    f.sm->Connect(f.device_a);
    REQUIRE(f.WaitSearching(f.device_a));
    f.discovery->Deliver(MakePseResult(f.device_a));
    REQUIRE(f.WaitState(ConnectionState::CONNECTED));
    REQUIRE(WaitFor([&] { return f.accounts->HasAccount(f.device_a); }));

    f.sm->Shutdown();
    // Accounts of a connection that never tore down are purged
    REQUIRE_FALSE(f.accounts->HasAccount(f.device_a));

    f.sm.reset();
    AccountStore reloaded(f.test_dir);
    REQUIRE(reloaded.ListAccounts().empty());
}
