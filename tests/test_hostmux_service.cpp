#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include <managers/hostmux_service.hpp>

static Config service_config() {
    auto r = Config::parse(R"(
hosts:
  web:
    host: web.example.org
    user: deploy
    password: secret
)");
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

TEST(HostmuxServiceTest, OpenTabByProfile) {
    FakeHost host;
    HostmuxService service(service_config(), fake_factory(host));

    auto r = service.open_tab("1", "web");
    ASSERT_TRUE(r.is_ok()) << r.error;

    auto tabs = service.tabs();
    ASSERT_EQ(tabs.size(), 1u);
    EXPECT_EQ(tabs[0].id, "1");
    EXPECT_EQ(tabs[0].host_name, "web");
    EXPECT_EQ(tabs[0].target, "deploy@web.example.org:22");
    EXPECT_EQ(tabs[0].state, "connected");
}

TEST(HostmuxServiceTest, UnknownProfileIsRejected) {
    FakeHost host;
    HostmuxService service(service_config(), fake_factory(host));

    auto r = service.open_tab("1", "nope");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Other);
    EXPECT_TRUE(service.tabs().empty());
    EXPECT_EQ(host.connect_calls.load(), 0);
}

TEST(HostmuxServiceTest, CloseTabReleasesTransport) {
    FakeHost host;
    HostmuxService service(service_config(), fake_factory(host));

    ASSERT_TRUE(service.open_tab("1", fake_host_config()).is_ok());
    ASSERT_TRUE(service.open_tab("2", fake_host_config("db")).is_ok());
    EXPECT_EQ(host.live_transports.load(), 2);

    service.close_tab("1");
    EXPECT_EQ(host.live_transports.load(), 1);
    ASSERT_EQ(service.tabs().size(), 1u);
    EXPECT_EQ(service.tabs()[0].id, "2");

    service.close_all();
    EXPECT_EQ(host.live_transports.load(), 0);
    EXPECT_TRUE(service.tabs().empty());
}
