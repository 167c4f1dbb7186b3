// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/notify/event.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace roomdl::notify {

// Must not block, sessions only enqueue the frame
using Subscriber = std::function<void(const Event&)>;

// Single broadcast topic. Delivery happens on the publishing thread,
// in subscription order, outside the channel's own lock.
class Channel {
public:
    using SubscriptionId = std::uint64_t;

    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    [[nodiscard]] SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id) noexcept;

    void publish(const Event& event);

    [[nodiscard]] std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_id_{1};
};

} // namespace roomdl::notify
