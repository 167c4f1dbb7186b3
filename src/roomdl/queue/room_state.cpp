// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/queue/room_state.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace roomdl::queue {

RoomState::RoomState(notify::Channel& channel, std::chrono::seconds idle_timeout)
    : channel_(channel)
    , idle_timeout_(idle_timeout) {
    data_.last_activity = Clock::now();
}

RoomData RoomState::snapshot() const {
    std::lock_guard lock(mutex_);
    return data_;
}

void RoomState::reset(RoomData data) {
    std::lock_guard lock(mutex_);
    data_ = std::move(data);
    touch_and_publish();
}

bool RoomState::idle_sweep(Clock::time_point now) {
    std::lock_guard lock(mutex_);

    bool downloading = std::any_of(data_.items.begin(), data_.items.end(),
                                   [](const Item& item) { return item.status == ItemStatus::downloading; });
    if (downloading || !data_.current_item.empty()) {
        return false;
    }
    if (now - data_.last_activity <= idle_timeout_) {
        return false;
    }
    if (data_.items.empty() && data_.history.empty()) {
        return false;
    }

    spdlog::info("Room idle since {}s, clearing {} items",
                 std::chrono::duration_cast<std::chrono::seconds>(now - data_.last_activity).count(),
                 data_.items.size());
    data_.items.clear();
    data_.history.clear();
    touch_and_publish();
    return true;
}

notify::Channel::SubscriptionId RoomState::connect(notify::Subscriber subscriber) {
    std::lock_guard lock(mutex_);
    subscriber(notify::RoomUpdate{data_});
    return channel_.subscribe(std::move(subscriber));
}

void RoomState::touch_and_publish() {
    data_.last_activity = Clock::now();
    channel_.publish(notify::RoomUpdate{data_});
}

} // namespace roomdl::queue
