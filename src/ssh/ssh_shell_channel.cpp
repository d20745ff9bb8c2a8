#include "ssh_shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>

SshShellChannel::SshShellChannel(std::shared_ptr<SshLink> link, LIBSSH2_CHANNEL* ch)
    : state_(std::make_shared<ReaderState>()) {
    state_->link = std::move(link);
    state_->ch = ch;
}

SshShellChannel::~SshShellChannel() {
    close();
}

void SshShellChannel::start(DataCallback on_data, ClosedCallback on_closed) {
    if (state_->running || !state_->open) return;
    state_->on_data = std::move(on_data);
    state_->on_closed = std::move(on_closed);
    state_->running = true;
    reader_thread_ = std::thread(&SshShellChannel::reader_loop, state_);
}

bool SshShellChannel::is_open() const {
    return state_->open;
}

// ── Reader ─────────────────────────────────────────────────────

void SshShellChannel::reader_loop(std::shared_ptr<ReaderState> state) {
    char buf[SHELL_READ_BUF_SIZE];
    SshLink& link = *state->link;

    while (state->running) {
        ssize_t n = 0;
        bool eof = false;
        bool link_down = false;
        {
            std::lock_guard<std::mutex> lock(link.io);
            if (!link.session || !state->ch) {
                link_down = true;
            } else {
                n = libssh2_channel_read(state->ch, buf, sizeof(buf));
                if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                    eof = libssh2_channel_eof(state->ch) != 0;
                    // Keepalives ride on the reader; a dead peer surfaces here.
                    int next = 0;
                    if (!eof && libssh2_keepalive_send(link.session, &next) != 0 &&
                        libssh2_session_last_errno(link.session) != LIBSSH2_ERROR_EAGAIN) {
                        link_down = true;
                    }
                }
            }
        }

        if (n > 0) {
            if (state->on_data) state->on_data(std::string(buf, static_cast<size_t>(n)));
            continue;
        }
        if (link_down || eof) break;
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            hostmux_log("shell channel read error " + std::to_string(n));
            break;
        }
        link.wait(SHELL_POLL_MS);
    }

    state->running = false;
    state->open = false;
    if (!state->closed_by_owner && state->on_closed) {
        state->on_closed();
    }
}

// ── Input ──────────────────────────────────────────────────────

Result<void> SshShellChannel::write(const std::string& bytes) {
    std::lock_guard<std::mutex> wlock(write_mutex_);
    if (!state_->open) return Result<void>::Err(ErrorKind::NotConnected, "Shell channel closed");

    SshLink& link = *state_->link;
    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(link.io);
            if (!link.session || !state_->ch) {
                return Result<void>::Err(ErrorKind::SessionClosed, "Session closed");
            }
            w = libssh2_channel_write(state_->ch, bytes.data() + sent, bytes.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(EAGAIN_POLL_MS);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(ErrorKind::RemoteIO, "Shell channel write error");
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> SshShellChannel::resize(int rows, int cols) {
    if (!state_->open) return Result<void>::Err(ErrorKind::NotConnected, "Shell channel closed");

    SshLink& link = *state_->link;
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link.io);
            if (!link.session || !state_->ch) {
                return Result<void>::Err(ErrorKind::SessionClosed, "Session closed");
            }
            rc = libssh2_channel_request_pty_size(state_->ch, cols, rows);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link.wait(EAGAIN_POLL_MS);
    }
    if (rc != 0) return Result<void>::Err(ErrorKind::Protocol, "PTY resize rejected");
    return Result<void>::Ok();
}

// ── Teardown ───────────────────────────────────────────────────

void SshShellChannel::release_channel() {
    std::lock_guard<std::mutex> lock(state_->link->io);
    if (!state_->ch) return;
    if (state_->link->session) {
        libssh2_channel_close(state_->ch);
        libssh2_channel_free(state_->ch);
    }
    state_->ch = nullptr;
}

void SshShellChannel::close() {
    state_->closed_by_owner = true;
    state_->running = false;
    state_->open = false;

    if (reader_thread_.joinable()) {
        if (reader_thread_.get_id() == std::this_thread::get_id()) {
            // Closed from inside a callback; the loop exits on its own.
            reader_thread_.detach();
        } else {
            reader_thread_.join();
        }
    }
    release_channel();
}
