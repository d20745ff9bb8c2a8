#include "data_relay.hpp"
#include <algorithm>

DataRelay::Unsubscribe DataRelay::subscribe(const SessionId& id, DataCallback on_data,
                                            ClosedCallback on_closed) {
    auto sub = std::make_shared<Subscriber>();
    sub->on_data = std::move(on_data);
    sub->on_closed = std::move(on_closed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sub->token = next_token_++;
        channels_[id].subscribers.push_back(sub);
    }

    std::weak_ptr<Subscriber> weak = sub;
    return [this, id, weak]() {
        auto s = weak.lock();
        if (!s) return;
        unsubscribe(id, s);
    };
}

void DataRelay::unsubscribe(const SessionId& id, const std::shared_ptr<Subscriber>& sub) {
    sub->active = false;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) return;
    auto& subs = it->second.subscribers;
    subs.erase(std::remove(subs.begin(), subs.end(), sub), subs.end());
}

std::shared_ptr<std::recursive_mutex> DataRelay::delivery_lock(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) return nullptr;
    return it->second.delivery;
}

std::uint64_t DataRelay::open_channel(const SessionId& id) {
    std::uint64_t previous = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& ch = channels_[id];
        if (ch.open) previous = ch.generation;
    }
    if (previous != 0) publish_closed(id, previous);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& ch = channels_[id];
    ch.generation = next_generation_++;
    ch.open = true;
    return ch.generation;
}

void DataRelay::publish_data(const SessionId& id, std::uint64_t generation,
                             const std::string& bytes) {
    // Late events for a forgotten id are dropped.
    auto delivery = delivery_lock(id);
    if (!delivery) return;
    std::lock_guard<std::recursive_mutex> dlock(*delivery);

    std::vector<std::shared_ptr<Subscriber>> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(id);
        if (it == channels_.end()) return;
        if (!it->second.open || it->second.generation != generation) return;
        subs = it->second.subscribers;
    }
    for (const auto& sub : subs) {
        if (sub->active && sub->on_data) sub->on_data(bytes);
    }
}

void DataRelay::publish_closed(const SessionId& id, std::uint64_t generation) {
    // Late events for a forgotten id are dropped.
    auto delivery = delivery_lock(id);
    if (!delivery) return;
    std::lock_guard<std::recursive_mutex> dlock(*delivery);

    std::vector<std::shared_ptr<Subscriber>> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(id);
        if (it == channels_.end()) return;
        if (!it->second.open || it->second.generation != generation) return;
        it->second.open = false;
        subs = it->second.subscribers;
    }
    for (const auto& sub : subs) {
        if (sub->active && sub->on_closed) sub->on_closed();
    }
}

bool DataRelay::is_open(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    return it != channels_.end() && it->second.open;
}

std::size_t DataRelay::subscriber_count(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    return it == channels_.end() ? 0 : it->second.subscribers.size();
}

std::size_t DataRelay::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

void DataRelay::forget(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(id);
    if (it == channels_.end()) return;
    for (auto& sub : it->second.subscribers) sub->active = false;
    channels_.erase(it);
}
