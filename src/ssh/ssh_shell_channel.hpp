#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <ssh/transport.hpp>
#include <ssh/ssh_transport.hpp>

// Interactive PTY shell on a libssh2 session. A reader thread polls the
// channel and hands every chunk to the data callback as it arrives.
class SshShellChannel : public ShellChannel {
public:
    SshShellChannel(std::shared_ptr<SshLink> link, LIBSSH2_CHANNEL* ch);
    ~SshShellChannel() override;

    SshShellChannel(const SshShellChannel&) = delete;
    SshShellChannel& operator=(const SshShellChannel&) = delete;

    void start(DataCallback on_data, ClosedCallback on_closed) override;
    Result<void> write(const std::string& bytes) override;
    Result<void> resize(int rows, int cols) override;
    void close() override;
    bool is_open() const override;

private:
    // Everything the reader thread touches. Shared with the thread so the
    // channel object may be destroyed from inside one of its own callbacks.
    struct ReaderState {
        std::shared_ptr<SshLink> link;
        LIBSSH2_CHANNEL* ch = nullptr;
        DataCallback on_data;
        ClosedCallback on_closed;
        std::atomic<bool> running{false};
        std::atomic<bool> open{true};
        std::atomic<bool> closed_by_owner{false};
    };

    static void reader_loop(std::shared_ptr<ReaderState> state);
    void release_channel();

    std::shared_ptr<ReaderState> state_;
    std::mutex write_mutex_;                 // single writer at a time
    std::thread reader_thread_;
};
