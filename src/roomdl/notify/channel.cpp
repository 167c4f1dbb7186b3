// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/notify/channel.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace roomdl::notify {

Channel::SubscriptionId Channel::subscribe(Subscriber subscriber) {
    std::lock_guard lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void Channel::unsubscribe(SubscriptionId id) noexcept {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
}

void Channel::publish(const Event& event) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard lock(mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& [id, subscriber] : subscribers_) {
            targets.push_back(subscriber);
        }
    }

    for (const auto& subscriber : targets) {
        try {
            subscriber(event);
        } catch (const std::exception& e) {
            spdlog::warn("Subscriber dropped an event: {}", e.what());
        }
    }
}

std::size_t Channel::subscriber_count() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
}

} // namespace roomdl::notify
