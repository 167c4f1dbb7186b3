// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/queue/item.hpp>
#include <roomdl/notify/channel.hpp>
#include <chrono>
#include <mutex>
#include <type_traits>
#include <utility>

namespace roomdl::queue {

// Process-wide shared room. Every mutation runs under one mutex and is
// published as a roomUpdate before the mutex is released, so observers
// see updates in mutation order.
class RoomState {
public:
    using Clock = std::chrono::system_clock;

    RoomState(notify::Channel& channel, std::chrono::seconds idle_timeout);

    RoomState(const RoomState&) = delete;
    RoomState& operator=(const RoomState&) = delete;

    [[nodiscard]] RoomData snapshot() const;

    // Apply fn to the room, bump lastActivity and publish
    template<typename Fn>
    decltype(auto) mutate(Fn&& fn) {
        std::lock_guard lock(mutex_);
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, RoomData&>>) {
            std::forward<Fn>(fn)(data_);
            touch_and_publish();
        } else {
            auto result = std::forward<Fn>(fn)(data_);
            touch_and_publish();
            return result;
        }
    }

    // fn returns whether it changed anything, only changes are published
    template<typename Fn>
    bool try_mutate(Fn&& fn) {
        std::lock_guard lock(mutex_);
        bool changed = std::forward<Fn>(fn)(data_);
        if (changed) {
            touch_and_publish();
        }
        return changed;
    }

    // Read under the mutex without publishing
    template<typename Fn>
    decltype(auto) inspect(Fn&& fn) const {
        std::lock_guard lock(mutex_);
        return std::forward<Fn>(fn)(static_cast<const RoomData&>(data_));
    }

    // Replace the whole room (state restore), publishes
    void reset(RoomData data);

    // Clears items and history once the room has been inactive longer than
    // the idle timeout. Never touches a room with a downloading item.
    bool idle_sweep(Clock::time_point now);

    // Deliver the current snapshot to the subscriber, then subscribe it,
    // both under the mutex so no update falls in between
    [[nodiscard]] notify::Channel::SubscriptionId connect(notify::Subscriber subscriber);

    [[nodiscard]] std::chrono::seconds idle_timeout() const noexcept { return idle_timeout_; }

private:
    void touch_and_publish();

    notify::Channel& channel_;
    std::chrono::seconds idle_timeout_;
    mutable std::mutex mutex_;
    RoomData data_;
};

} // namespace roomdl::queue
