#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

// Fans shell output and closure out to subscribers keyed by SessionId.
//
// Every shell channel gets a generation from open_channel(); events carrying
// an older generation are dropped, so output from a discarded session never
// reaches a tab after it reconnected. Per channel lifetime on_closed fires
// exactly once and nothing is delivered after it.
class DataRelay {
public:
    using DataCallback = std::function<void(const std::string& bytes)>;
    using ClosedCallback = std::function<void()>;
    using Unsubscribe = std::function<void()>;

    // The returned handle is idempotent and may be called from a callback.
    Unsubscribe subscribe(const SessionId& id, DataCallback on_data,
                          ClosedCallback on_closed);

    // Start a new channel lifetime for the id. A still-open previous
    // lifetime is closed first.
    std::uint64_t open_channel(const SessionId& id);

    void publish_data(const SessionId& id, std::uint64_t generation,
                      const std::string& bytes);
    void publish_closed(const SessionId& id, std::uint64_t generation);

    bool is_open(const SessionId& id) const;
    std::size_t subscriber_count(const SessionId& id) const;
    std::size_t channel_count() const;      // ids with relay state

    // Drop all state for an id (tab closed for good).
    void forget(const SessionId& id);

private:
    struct Subscriber {
        std::uint64_t token;
        DataCallback on_data;
        ClosedCallback on_closed;
        std::atomic<bool> active{true};
    };

    struct Channel {
        std::uint64_t generation = 0;
        bool open = false;
        std::vector<std::shared_ptr<Subscriber>> subscribers;
        // Serializes delivery per id; recursive so callbacks may publish.
        std::shared_ptr<std::recursive_mutex> delivery =
            std::make_shared<std::recursive_mutex>();
    };

    std::shared_ptr<std::recursive_mutex> delivery_lock(const SessionId& id);
    void unsubscribe(const SessionId& id, const std::shared_ptr<Subscriber>& sub);

    mutable std::mutex mutex_;
    std::map<SessionId, Channel> channels_;
    std::uint64_t next_generation_ = 1;
    std::uint64_t next_token_ = 1;
};
