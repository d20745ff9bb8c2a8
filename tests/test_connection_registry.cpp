#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include <managers/connection_registry.hpp>
#include <managers/data_relay.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

class ConnectionRegistryTest : public ::testing::Test {
protected:
    FakeHost host;
    DataRelay relay;
    ConnectionRegistry registry{fake_factory(host), relay, TerminalSize{40, 120, "xterm-256color"}};

    std::mutex events_mutex;
    std::vector<std::pair<SessionId, SessionStatus>> events;

    void SetUp() override {
        registry.set_status_listener([this](const SessionId& id, SessionStatus s) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back({id, s});
        });
    }

    void TearDown() override {
        registry.set_status_listener(nullptr);
        registry.disconnect_all();
    }

    int count(SessionStatus s) {
        std::lock_guard<std::mutex> lock(events_mutex);
        int n = 0;
        for (const auto& e : events) n += e.second == s;
        return n;
    }
};

TEST_F(ConnectionRegistryTest, EnsureConnectsAndOpensShell) {
    auto r = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value->status(), SessionStatus::Connected);
    EXPECT_EQ(host.live_transports.load(), 1);
    ASSERT_EQ(host.shell_count(), 1u);
    EXPECT_EQ(host.last_shell()->rows, 40);
    EXPECT_EQ(host.last_shell()->cols, 120);
    EXPECT_TRUE(relay.is_open("t1"));
    EXPECT_EQ(count(SessionStatus::Connecting), 1);
    EXPECT_EQ(count(SessionStatus::Connected), 1);
}

TEST_F(ConnectionRegistryTest, EnsureReusesConnectedSession) {
    auto a = registry.ensure("t1", fake_host_config());
    auto b = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value, b.value);
    EXPECT_EQ(host.connect_calls.load(), 1);
    EXPECT_EQ(host.live_transports.load(), 1);
}

TEST_F(ConnectionRegistryTest, AuthenticationFailureLeavesNothingBehind) {
    auto cfg = fake_host_config();
    cfg.password = std::string("wrong");
    auto r = registry.ensure("t1", cfg);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Authentication);
    EXPECT_EQ(registry.find("t1"), nullptr);
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_EQ(count(SessionStatus::Disconnected), 1);
}

TEST_F(ConnectionRegistryTest, UnreachableHost) {
    host.unreachable = true;
    auto r = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Unreachable);
    EXPECT_EQ(host.live_transports.load(), 0);
}

TEST_F(ConnectionRegistryTest, RefusedShellClosesTransport) {
    host.shell_refused = true;
    auto r = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Protocol);
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_EQ(registry.find("t1"), nullptr);
}

TEST_F(ConnectionRegistryTest, ShellOutputReachesSubscribers) {
    std::string out;
    auto unsub = relay.subscribe("t1", [&](const std::string& b) { out += b; }, nullptr);
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());

    host.last_shell()->emit("Welcome\r\n");
    host.last_shell()->emit("$ ");
    EXPECT_EQ(out, "Welcome\r\n$ ");
}

TEST_F(ConnectionRegistryTest, WriteAndResizeReachShell) {
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());
    ASSERT_TRUE(registry.write("t1", "ls -la\n").is_ok());
    EXPECT_EQ(host.last_shell()->input(), "ls -la\n");

    ASSERT_TRUE(registry.resize("t1", 30, 100).is_ok());
    EXPECT_EQ(host.last_shell()->rows, 30);
    EXPECT_EQ(host.last_shell()->cols, 100);
}

TEST_F(ConnectionRegistryTest, WriteWithoutSessionIsNotConnected) {
    auto r = registry.write("nope", "x");
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_TRUE(registry.resize("nope", 10, 10).is_ok());
    EXPECT_EQ(registry.exec("nope", "pwd").kind, ErrorKind::NotConnected);
}

TEST_F(ConnectionRegistryTest, ExecRunsOneShotCommand) {
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());
    auto r = registry.exec("t1", "pwd");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.exit_code, 0);
    EXPECT_EQ(r.value.stdout_data, "/home/user\n");
}

TEST_F(ConnectionRegistryTest, RemoteHangupDisconnects) {
    int closed = 0;
    auto unsub = relay.subscribe("t1", nullptr, [&]() { closed++; });
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());

    host.last_shell()->hangup();
    EXPECT_EQ(closed, 1);
    EXPECT_EQ(count(SessionStatus::Disconnected), 1);
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_EQ(registry.write("t1", "x").kind, ErrorKind::NotConnected);
}

TEST_F(ConnectionRegistryTest, HangupThenEnsureBuildsFreshSession) {
    auto first = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(first.is_ok());
    host.last_shell()->hangup();

    auto second = registry.ensure("t1", fake_host_config());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value, second.value);
    EXPECT_EQ(host.live_transports.load(), 1);
    EXPECT_EQ(host.shell_count(), 2u);
}

TEST_F(ConnectionRegistryTest, DisconnectTwiceIsHarmless) {
    int closed = 0;
    auto unsub = relay.subscribe("t1", nullptr, [&]() { closed++; });
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());

    registry.disconnect("t1");
    registry.disconnect("t1");
    registry.disconnect("never-opened");

    EXPECT_EQ(registry.find("t1"), nullptr);
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_EQ(closed, 1);
    EXPECT_EQ(count(SessionStatus::Disconnected), 1);
}

TEST_F(ConnectionRegistryTest, OldShellOutputIsDroppedAfterDisconnect) {
    std::string out;
    auto unsub = relay.subscribe("t1", [&](const std::string& b) { out += b; }, nullptr);
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());
    auto old_shell = host.last_shell();
    registry.disconnect("t1");
    ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());

    // The old channel is closed; even a late callback carries a stale generation.
    auto late = old_shell->on_data;
    if (late) late("ghost");
    host.last_shell()->emit("fresh");
    EXPECT_EQ(out, "fresh");
}

TEST_F(ConnectionRegistryTest, SessionsAreIndependent) {
    ASSERT_TRUE(registry.ensure("t1", fake_host_config("a")).is_ok());
    ASSERT_TRUE(registry.ensure("t2", fake_host_config("b")).is_ok());
    EXPECT_EQ(host.live_transports.load(), 2);

    registry.disconnect("t1");
    EXPECT_EQ(host.live_transports.load(), 1);
    auto t2 = registry.find("t2");
    ASSERT_NE(t2, nullptr);
    EXPECT_EQ(t2->status(), SessionStatus::Connected);
    EXPECT_TRUE(registry.exec("t2", "pwd").is_ok());
}

TEST_F(ConnectionRegistryTest, ConcurrentEnsureOpensOneTransport) {
    host.on_connect = []() { std::this_thread::sleep_for(std::chrono::milliseconds(50)); };

    std::vector<std::future<Result<std::shared_ptr<Session>>>> results;
    for (int i = 0; i < 4; i++) {
        results.push_back(std::async(std::launch::async, [this]() {
            return registry.ensure("t1", fake_host_config());
        }));
    }
    std::shared_ptr<Session> first;
    for (auto& f : results) {
        auto r = f.get();
        ASSERT_TRUE(r.is_ok()) << r.error;
        if (!first) first = r.value;
        EXPECT_EQ(r.value, first);
    }
    EXPECT_EQ(host.connect_calls.load(), 1);
    EXPECT_EQ(host.live_transports.load(), 1);
}

TEST_F(ConnectionRegistryTest, DisconnectDuringConnectWins) {
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    host.on_connect = [&entered, release_future]() {
        entered.set_value();
        release_future.wait();
    };

    auto pending = std::async(std::launch::async, [this]() {
        return registry.ensure("t1", fake_host_config());
    });
    entered.get_future().wait();
    registry.disconnect("t1");
    release.set_value();

    auto r = pending.get();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SessionClosed);
    EXPECT_EQ(registry.find("t1"), nullptr);
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_EQ(count(SessionStatus::Disconnected), 1);
}
