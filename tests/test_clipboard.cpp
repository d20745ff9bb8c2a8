#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include <managers/clipboard_coordinator.hpp>
#include <managers/connection_registry.hpp>
#include <managers/data_relay.hpp>
#include <managers/dependency_installer.hpp>
#include <managers/file_operation_orchestrator.hpp>

static RemoteItem item(const std::string& path, bool dir = false) {
    return RemoteItem{path, remote_basename(path), dir};
}

class ClipboardTest : public ::testing::Test {
protected:
    FakeHost host;
    DataRelay relay;
    ConnectionRegistry registry{fake_factory(host), relay, TerminalSize{}};
    DependencyInstaller installer{registry};
    FileOperationOrchestrator files{registry, installer};
    ClipboardCoordinator clipboard{files};

    void SetUp() override {
        host.add_dir("/home/user/src");
        host.add_dir("/home/user/dst");
        host.add_file("/home/user/src/a.txt", "A");
        host.add_file("/home/user/src/b.txt", "B");
        ASSERT_TRUE(registry.ensure("t1", fake_host_config()).is_ok());
        ASSERT_TRUE(registry.ensure("t2", fake_host_config("other")).is_ok());
    }
};

TEST_F(ClipboardTest, StartsEmpty) {
    EXPECT_FALSE(clipboard.current().has_value());
    auto r = clipboard.paste("t1", "/home/user/dst");
    EXPECT_EQ(r.kind, ErrorKind::UnsupportedOperation);
}

TEST_F(ClipboardTest, SetReplacesEntry) {
    clipboard.set_copy("t1", {item("/home/user/src/a.txt")});
    clipboard.set_cut("t1", {item("/home/user/src/b.txt")});
    auto entry = clipboard.current();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->operation, ClipboardOperation::Cut);
    ASSERT_EQ(entry->items.size(), 1u);
    EXPECT_EQ(entry->items[0].name, "b.txt");

    clipboard.set_copy("t1", {});
    EXPECT_FALSE(clipboard.current().has_value());
}

TEST_F(ClipboardTest, CopyPasteKeepsEntry) {
    clipboard.set_copy("t1", {item("/home/user/src/a.txt"), item("/home/user/src/b.txt")});
    auto r = clipboard.paste("t1", "/home/user/dst");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.ok());
    EXPECT_EQ(host.content("/home/user/dst/a.txt"), "A");
    EXPECT_EQ(host.content("/home/user/dst/b.txt"), "B");
    EXPECT_TRUE(host.exists("/home/user/src/a.txt"));

    auto entry = clipboard.current();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->items.size(), 2u);
}

TEST_F(ClipboardTest, CopyPasteIntoSameDirectoryMakesCopyNames) {
    clipboard.set_copy("t1", {item("/home/user/src/a.txt")});
    ASSERT_TRUE(clipboard.paste("t1", "/home/user/src").is_ok());
    ASSERT_TRUE(clipboard.paste("t1", "/home/user/src").is_ok());
    EXPECT_TRUE(host.exists("/home/user/src/a copy.txt"));
    EXPECT_TRUE(host.exists("/home/user/src/a copy 2.txt"));
}

TEST_F(ClipboardTest, CutPasteMovesAndClears) {
    clipboard.set_cut("t1", {item("/home/user/src/a.txt"), item("/home/user/src/b.txt")});
    auto r = clipboard.paste("t1", "/home/user/dst");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.ok());
    EXPECT_FALSE(host.exists("/home/user/src/a.txt"));
    EXPECT_EQ(host.content("/home/user/dst/a.txt"), "A");
    EXPECT_EQ(host.content("/home/user/dst/b.txt"), "B");
    EXPECT_FALSE(clipboard.current().has_value());
    EXPECT_FALSE(host.ran("cp -r"));
}

TEST_F(ClipboardTest, CutPasteIntoSameDirectorySkips) {
    clipboard.set_cut("t1", {item("/home/user/src/a.txt")});
    auto r = clipboard.paste("t1", "/home/user/src");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.items.size(), 1u);
    EXPECT_EQ(r.value.items[0].status, ItemStatus::Skipped);
    EXPECT_TRUE(host.exists("/home/user/src/a.txt"));
    EXPECT_FALSE(clipboard.current().has_value());
}

TEST_F(ClipboardTest, PasteIntoOtherSessionIsRejected) {
    clipboard.set_cut("t1", {item("/home/user/src/a.txt")});
    auto r = clipboard.paste("t2", "/home/user/dst");
    EXPECT_EQ(r.kind, ErrorKind::CrossSessionPasteUnsupported);
    EXPECT_TRUE(host.exists("/home/user/src/a.txt"));

    auto entry = clipboard.current();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->source_session_id, "t1");
    EXPECT_EQ(entry->operation, ClipboardOperation::Cut);
    EXPECT_EQ(entry->items.size(), 1u);
}

TEST_F(ClipboardTest, PartialCutKeepsUnmovedItems) {
    // b.txt already exists at the destination, so its rename fails.
    host.add_file("/home/user/dst/b.txt", "old");
    host.add_file("/home/user/src/c.txt", "C");
    clipboard.set_cut("t1", {item("/home/user/src/a.txt"), item("/home/user/src/b.txt"),
                             item("/home/user/src/c.txt")});

    auto r = clipboard.paste("t1", "/home/user/dst");
    ASSERT_TRUE(r.is_ok());
    const auto& report = r.value;
    EXPECT_EQ(report.items[0].status, ItemStatus::Completed);
    EXPECT_EQ(report.items[1].status, ItemStatus::Failed);
    EXPECT_EQ(report.items[2].status, ItemStatus::NotAttempted);
    EXPECT_TRUE(host.exists("/home/user/src/c.txt"));

    auto entry = clipboard.current();
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->items.size(), 2u);
    EXPECT_EQ(entry->items[0].name, "b.txt");
    EXPECT_EQ(entry->items[1].name, "c.txt");
}

TEST_F(ClipboardTest, PasteAfterTabClosedFails) {
    clipboard.set_copy("t1", {item("/home/user/src/a.txt")});
    registry.disconnect("t1");
    auto r = clipboard.paste("t1", "/home/user/dst");
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::NotConnected);
    EXPECT_FALSE(host.exists("/home/user/dst/a.txt"));
    ASSERT_TRUE(clipboard.current().has_value());
}

TEST_F(ClipboardTest, CutPasteObservesTabClosedMidway) {
    host.add_file("/home/user/src/c.txt", "C");
    // The first move's refresh closes the tab before the next item.
    bool closed_once = false;
    files.set_listing_observer([&](const SessionId&, const std::string&,
                                   const Result<std::vector<FileEntry>>&) {
        if (!closed_once) {
            closed_once = true;
            registry.disconnect("t1");
        }
    });
    clipboard.set_cut("t1", {item("/home/user/src/a.txt"), item("/home/user/src/b.txt"),
                             item("/home/user/src/c.txt")});

    auto r = clipboard.paste("t1", "/home/user/dst");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& report = r.value;
    ASSERT_EQ(report.items.size(), 3u);
    EXPECT_EQ(report.items[0].status, ItemStatus::Completed);
    EXPECT_EQ(report.items[1].status, ItemStatus::NotAttempted);
    EXPECT_EQ(report.items[1].kind, ErrorKind::SessionClosed);
    EXPECT_EQ(report.items[2].status, ItemStatus::NotAttempted);
    EXPECT_EQ(report.items[2].kind, ErrorKind::SessionClosed);
    EXPECT_TRUE(host.exists("/home/user/dst/a.txt"));
    EXPECT_TRUE(host.exists("/home/user/src/b.txt"));
    EXPECT_TRUE(host.exists("/home/user/src/c.txt"));

    auto entry = clipboard.current();
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->items.size(), 2u);
    EXPECT_EQ(entry->items[0].name, "b.txt");
}
