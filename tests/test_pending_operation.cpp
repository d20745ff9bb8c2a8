#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include <managers/pending_operation.hpp>
#include <managers/dependency_installer.hpp>
#include <managers/connection_registry.hpp>
#include <managers/data_relay.hpp>
#include <future>

static std::shared_ptr<PendingOperation> make_op(const std::string& tool = "zip") {
    return std::make_shared<PendingOperation>("install-dependency", tool, "t1", "/home/user",
                                              std::vector<RemoteItem>{});
}

TEST(PendingOperationTest, StartsPrompting) {
    auto op = make_op();
    EXPECT_EQ(op->state(), OperationState::Prompting);
    EXPECT_FALSE(op->is_resolved());
    EXPECT_EQ(op->tool(), "zip");
    EXPECT_EQ(op->target_session_id(), "t1");
}

TEST(PendingOperationTest, ResolvesExactlyOnce) {
    auto op = make_op();
    ASSERT_TRUE(op->begin_running());
    EXPECT_FALSE(op->begin_running());
    EXPECT_TRUE(op->resolve(true));
    EXPECT_FALSE(op->resolve(false));
    EXPECT_EQ(op->state(), OperationState::Succeeded);
    EXPECT_FALSE(op->decline());
}

TEST(PendingOperationTest, DeclineFailsAndLogs) {
    auto op = make_op();
    EXPECT_TRUE(op->decline());
    EXPECT_EQ(op->state(), OperationState::Failed);
    ASSERT_EQ(op->log().size(), 1u);
    EXPECT_EQ(op->log()[0], "> Declined by user");
    EXPECT_FALSE(op->decline());
    EXPECT_FALSE(op->begin_running());
}

TEST(PendingOperationTest, DeclineAfterRunningIsRejected) {
    auto op = make_op();
    ASSERT_TRUE(op->begin_running());
    EXPECT_FALSE(op->decline());
    EXPECT_EQ(op->state(), OperationState::Running);
}

TEST(PendingOperationTest, ListenerReplaysBacklog) {
    auto op = make_op();
    op->append_log("> one");
    std::vector<std::string> lines;
    op->set_log_listener([&](const std::string& l) { lines.push_back(l); });
    op->append_log("> two");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "> one");
    EXPECT_EQ(lines[1], "> two");
}

TEST(PendingOperationTest, WaitUnblocksOnResolution) {
    auto op = make_op();
    auto waiter = std::async(std::launch::async, [op]() { return op->wait(); });
    op->begin_running();
    op->resolve(false);
    EXPECT_EQ(waiter.get(), OperationState::Failed);
}

// ── DependencyInstaller ────────────────────────────────────────

class DependencyInstallerTest : public ::testing::Test {
protected:
    FakeHost host;
    DataRelay relay;
    ConnectionRegistry registry{fake_factory(host), relay, TerminalSize{}};
    DependencyInstaller installer{registry};

    void SetUp() override {
        ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());
    }
};

TEST_F(DependencyInstallerTest, ProbesWithCommandV) {
    auto zip = installer.is_available("t1", "zip");
    ASSERT_TRUE(zip.is_ok());
    EXPECT_TRUE(zip.value);
    EXPECT_TRUE(host.ran("command -v 'zip'"));

    host.uninstall("zip");
    auto gone = installer.is_available("t1", "zip");
    ASSERT_TRUE(gone.is_ok());
    EXPECT_FALSE(gone.value);
}

TEST_F(DependencyInstallerTest, InstallCommands) {
    EXPECT_EQ(DependencyInstaller::install_command("apt", "zip"),
              "export DEBIAN_FRONTEND=noninteractive && sudo -n apt-get update && "
              "sudo -n apt-get install -y 'zip'");
    EXPECT_EQ(DependencyInstaller::install_command("dnf", "unzip"), "sudo -n dnf install -y 'unzip'");
    EXPECT_EQ(DependencyInstaller::install_command("yum", "tar"), "sudo -n yum install -y 'tar'");
    EXPECT_EQ(DependencyInstaller::install_command("apk", "zip"), "sudo -n apk add 'zip'");
}

TEST_F(DependencyInstallerTest, InstallSucceedsAndLogs) {
    host.uninstall("zip");
    host.package_manager = "apk";
    auto op = make_op("zip");

    auto r = installer.install(*op);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(op->state(), OperationState::Succeeded);
    EXPECT_TRUE(host.has_tool("zip"));
    EXPECT_TRUE(host.ran("sudo -n apk add 'zip'"));

    auto log = op->log();
    ASSERT_FALSE(log.empty());
    EXPECT_EQ(log.front(), "> Detecting package manager...");
    EXPECT_EQ(log.back(), "> Successfully installed zip!");
    for (const auto& line : log) EXPECT_EQ(line.rfind("> ", 0), 0u) << line;
}

TEST_F(DependencyInstallerTest, UnknownPackageManagerFails) {
    host.package_manager = "unknown";
    auto op = make_op("zip");
    auto r = installer.install(*op);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::MissingDependency);
    EXPECT_EQ(op->state(), OperationState::Failed);
}

TEST_F(DependencyInstallerTest, FailedInstallCommandFails) {
    host.uninstall("zip");
    host.install_fails = true;
    auto op = make_op("zip");
    auto r = installer.install(*op);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(op->state(), OperationState::Failed);
    EXPECT_FALSE(host.has_tool("zip"));

    bool saw_exit = false;
    for (const auto& line : op->log()) saw_exit |= line.find("Exit Code: 100") != std::string::npos;
    EXPECT_TRUE(saw_exit);
}

TEST_F(DependencyInstallerTest, DeclinedOperationCannotBeInstalled) {
    auto op = make_op("zip");
    op->decline();
    auto r = installer.install(*op);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(op->state(), OperationState::Failed);
    EXPECT_FALSE(host.ran("install"));
}
