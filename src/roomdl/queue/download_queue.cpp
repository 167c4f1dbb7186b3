// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/queue/download_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace roomdl::queue {

namespace {

const std::string& cancel_reason() {
    static const std::string reason = core::make_error_code(core::TransferErrc::cancelled).message();
    return reason;
}

void erase_item(RoomData& room, std::string_view name) {
    room.items.erase(std::remove_if(room.items.begin(), room.items.end(),
                                    [&](const Item& item) { return item.name == name; }),
                     room.items.end());
}

} // namespace

ItemStatus classify(const core::TransferError& error) noexcept {
    if (error.is(core::TransferErrc::missing_source)) {
        return ItemStatus::needs_resolve;
    }
    if (error.is(core::TransferErrc::truncated)) {
        return ItemStatus::corrupted;
    }
    return ItemStatus::failed;
}

bool is_valid_item_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

//=============================================================================
// DownloadQueue
//=============================================================================

DownloadQueue::DownloadQueue(RoomState& room,
                             notify::Channel& channel,
                             core::Transfer& transfer,
                             catalog::Catalog& catalog,
                             organizer::Organizer* organizer,
                             std::filesystem::path download_dir)
    : room_(room)
    , channel_(channel)
    , transfer_(transfer)
    , catalog_(catalog)
    , organizer_(organizer)
    , download_dir_(std::move(download_dir)) {}

DownloadQueue::~DownloadQueue() {
    shutdown();
}

EnqueueResult DownloadQueue::enqueue(const std::vector<EnqueueRequest>& requests, std::string_view listing_url) {
    EnqueueResult result;
    auto now = RoomState::Clock::now();

    room_.try_mutate([&](RoomData& room) {
        bool changed = false;
        if (!listing_url.empty() && room.listing_url != listing_url) {
            room.listing_url = std::string(listing_url);
            changed = true;
        }

        for (const auto& request : requests) {
            if (!is_valid_item_name(request.name)) {
                ++result.rejected;
                continue;
            }
            if (const auto* existing = room.find(request.name)) {
                if (!is_terminal(existing->status)) {
                    ++result.already_queued;
                    continue;
                }
                erase_item(room, request.name);
            }

            Item item;
            item.name = request.name;
            item.source_url = request.download_url;
            item.declared_size = request.size;
            item.listing_url = std::string(listing_url);
            item.status = ItemStatus::available;
            item.enqueued_at = now;
            item.updated_at = now;
            room.items.push_back(std::move(item));
            ++result.added;
            changed = true;
        }
        return changed;
    });

    spdlog::info("Enqueued {} items ({} already queued, {} rejected)",
                 result.added, result.already_queued, result.rejected);

    if (result.added > 0) {
        start_processing();
    }
    return result;
}

void DownloadQueue::start_processing() {
    std::lock_guard lock(worker_mutex_);
    if (shut_down_ || running_.load(std::memory_order_acquire)) {
        return;
    }
    // A previous worker has already left its loop
    if (worker_.joinable()) {
        worker_.join();
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
}

std::error_code DownloadQueue::cancel(std::string_view name) {
    std::error_code ec;
    bool signal_worker = false;
    auto now = RoomState::Clock::now();

    room_.try_mutate([&](RoomData& room) {
        auto* item = room.find(name);
        if (!item) {
            ec = make_error_code(QueueErrc::not_found);
            return false;
        }
        switch (item->status) {
            case ItemStatus::downloading:
                signal_worker = true;
                return false;
            case ItemStatus::available:
                item->status = ItemStatus::failed;
                item->error = cancel_reason();
                item->updated_at = now;
                room.record({item->name, std::string(to_string(item->status)), now, item->error});
                return true;
            default:
                return false;
        }
    });

    if (signal_worker) {
        std::lock_guard lock(active_mutex_);
        if (active_name_ == name) {
            spdlog::info("Cancelling {}", name);
            active_stop_.request_stop();
        }
    }
    return ec;
}

std::error_code DownloadQueue::retry(std::string_view name) {
    auto current = room_.inspect([&](const RoomData& room) -> std::optional<Item> {
        if (const auto* item = room.find(name)) {
            return *item;
        }
        return std::nullopt;
    });
    if (!current) {
        return make_error_code(QueueErrc::not_found);
    }
    if (!is_retryable(current->status)) {
        return make_error_code(QueueErrc::invalid_state);
    }

    std::string url = current->source_url;
    if (current->status == ItemStatus::needs_resolve || url.empty()) {
        auto resolved = resolve(*current);
        if (!resolved) {
            spdlog::warn("Retry of {} left it unresolved: {}", name, resolved.error());
            return make_error_code(QueueErrc::resolve_failed);
        }
        url = std::move(*resolved);
    }

    std::error_code ec;
    auto now = RoomState::Clock::now();
    room_.try_mutate([&](RoomData& room) {
        auto* item = room.find(name);
        if (!item) {
            ec = make_error_code(QueueErrc::not_found);
            return false;
        }
        if (!is_retryable(item->status)) {
            ec = make_error_code(QueueErrc::invalid_state);
            return false;
        }
        Item retried = *item;
        retried.status = ItemStatus::available;
        retried.source_url = url;
        retried.error.clear();
        retried.file_path.clear();
        retried.updated_at = now;
        erase_item(room, name);
        room.items.push_back(std::move(retried));
        return true;
    });
    if (ec) {
        return ec;
    }

    spdlog::info("Retrying {}", name);
    start_processing();
    return {};
}

std::error_code DownloadQueue::remove(std::string_view name) {
    std::error_code ec;
    room_.try_mutate([&](RoomData& room) {
        const auto* item = room.find(name);
        if (!item) {
            ec = make_error_code(QueueErrc::not_found);
            return false;
        }
        if (item->status == ItemStatus::downloading) {
            ec = make_error_code(QueueErrc::invalid_state);
            return false;
        }
        erase_item(room, name);
        return true;
    });
    if (!ec) {
        spdlog::info("Removed {}", name);
    }
    return ec;
}

std::size_t DownloadQueue::retry_all_failed() {
    auto names = room_.inspect([](const RoomData& room) {
        std::vector<std::string> out;
        for (const auto& item : room.items) {
            if (is_retryable(item.status)) {
                out.push_back(item.name);
            }
        }
        return out;
    });

    std::size_t count = 0;
    for (const auto& name : names) {
        if (!retry(name)) {
            ++count;
        }
    }
    return count;
}

void DownloadQueue::set_ruleset(std::string name) {
    room_.mutate([&](RoomData& room) { room.ruleset = std::move(name); });
}

void DownloadQueue::set_listing_url(std::string url) {
    room_.mutate([&](RoomData& room) { room.listing_url = std::move(url); });
}

void DownloadQueue::shutdown() {
    std::jthread worker;
    {
        std::lock_guard lock(worker_mutex_);
        shut_down_ = true;
        worker = std::move(worker_);
    }
    worker.request_stop();
    {
        std::lock_guard lock(active_mutex_);
        if (active_stop_.stop_possible()) {
            active_stop_.request_stop();
        }
    }
    if (worker.joinable()) {
        worker.join();
    }
}

bool DownloadQueue::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(worker_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !running_.load(std::memory_order_acquire); });
}

//=============================================================================
// Worker
//=============================================================================

void DownloadQueue::worker_loop(std::stop_token stop) {
    spdlog::debug("Queue worker started");
    while (!stop.stop_requested()) {
        auto next = claim_next();
        if (!next) {
            // Re-check under the worker lock so a concurrent start_processing is never lost
            std::lock_guard lock(worker_mutex_);
            if (!stop.stop_requested()) {
                next = claim_next();
            }
            if (!next) {
                running_.store(false, std::memory_order_release);
                idle_cv_.notify_all();
                spdlog::debug("Queue worker idle");
                return;
            }
        }

        Item item = *next;
        try {
            process(std::move(*next), stop);
        } catch (const std::exception& e) {
            spdlog::error("Download of {} aborted: {}", item.name, e.what());
            {
                std::lock_guard lock(active_mutex_);
                active_name_.clear();
            }
            finish_failure(item, ItemStatus::failed, e.what());
        }
    }

    std::lock_guard lock(worker_mutex_);
    running_.store(false, std::memory_order_release);
    idle_cv_.notify_all();
}

std::optional<Item> DownloadQueue::claim_next() {
    std::optional<Item> claimed;
    auto now = RoomState::Clock::now();

    room_.try_mutate([&](RoomData& room) {
        auto it = std::find_if(room.items.begin(), room.items.end(),
                               [](const Item& item) { return item.status == ItemStatus::available; });
        if (it == room.items.end()) {
            return false;
        }
        it->status = ItemStatus::downloading;
        it->error.clear();
        it->updated_at = now;
        room.current_item = it->name;

        // Armed before the room is published so cancel() always finds it
        std::lock_guard lock(active_mutex_);
        active_name_ = it->name;
        active_stop_ = std::stop_source{};

        claimed = *it;
        return true;
    });
    return claimed;
}

void DownloadQueue::process(Item item, std::stop_token worker_stop) {
    std::stop_source source;
    {
        std::lock_guard lock(active_mutex_);
        source = active_stop_;
    }
    std::stop_callback forward_shutdown(worker_stop, [&source] { source.request_stop(); });
    std::stop_token stop = source.get_token();

    spdlog::info("Downloading {}", item.name);

    std::string url = item.source_url;
    if (url.empty()) {
        auto resolved = resolve(item);
        if (!resolved) {
            {
                std::lock_guard lock(active_mutex_);
                active_name_.clear();
            }
            spdlog::warn("{} needs resolving: {}", item.name, resolved.error());
            finish_failure(item, ItemStatus::needs_resolve, resolved.error());
            return;
        }
        url = std::move(*resolved);
        room_.mutate([&](RoomData& room) {
            if (auto* found = room.find(item.name)) {
                found->source_url = url;
            }
        });
    }

    std::string destination = (download_dir_ / item.name).string();
    const std::string& name = item.name;
    auto result = transfer_.run(url, destination,
        [this, &name](const core::ProgressSample& sample) {
            channel_.publish(notify::FileProgress{name, sample});
        },
        stop);

    {
        std::lock_guard lock(active_mutex_);
        active_name_.clear();
    }

    if (result) {
        spdlog::info("Finished {} ({} bytes)", item.name, *result);
        finish_success(item, destination, *result);
        return;
    }

    const auto& error = result.error();
    if (error.is(core::TransferErrc::cancelled) && worker_stop.stop_requested()) {
        // Shutting down, leave the item for the next run
        spdlog::info("Interrupted {} for shutdown", item.name);
        room_.mutate([&](RoomData& room) {
            if (auto* found = room.find(item.name)) {
                found->status = ItemStatus::available;
                found->updated_at = RoomState::Clock::now();
            }
            if (room.current_item == item.name) {
                room.current_item.clear();
            }
        });
        return;
    }

    if (error.is(core::TransferErrc::cancelled)) {
        spdlog::info("Cancelled {}", item.name);
    } else {
        spdlog::error("Download of {} failed: {}", item.name, error.message());
    }
    finish_failure(item, classify(error), error.message());
}

void DownloadQueue::finish_success(const Item& item, const std::string& path, std::uint64_t bytes) {
    auto now = RoomState::Clock::now();
    std::string ruleset;

    room_.mutate([&](RoomData& room) {
        if (auto* found = room.find(item.name)) {
            found->status = ItemStatus::success;
            found->error.clear();
            found->file_path = path;
            found->updated_at = now;
        }
        room.record({item.name, std::string(to_string(ItemStatus::success)), now, {}});
        ruleset = room.ruleset;
    });
    spdlog::debug("{} stored at {} ({} bytes)", item.name, path, bytes);

    if (!ruleset.empty() && organizer_) {
        run_organizer(item.name, path, ruleset);
    }

    room_.mutate([&](RoomData& room) {
        if (room.current_item == item.name) {
            room.current_item.clear();
        }
    });
}

void DownloadQueue::finish_failure(const Item& item, ItemStatus status, const std::string& reason) {
    auto now = RoomState::Clock::now();
    room_.mutate([&](RoomData& room) {
        if (auto* found = room.find(item.name)) {
            found->status = status;
            found->error = reason;
            found->updated_at = now;
        }
        room.record({item.name, std::string(to_string(status)), now, reason});
        if (room.current_item == item.name) {
            room.current_item.clear();
        }
    });
}

void DownloadQueue::run_organizer(const std::string& name, const std::string& path, const std::string& ruleset) {
    organizer::OrganizeResult result;
    try {
        result = organizer_->apply(ruleset, path);
    } catch (const std::exception& e) {
        result.errors.emplace_back(e.what());
    }

    for (const auto& error : result.errors) {
        spdlog::warn("Organizer ({}) on {}: {}", ruleset, name, error);
    }
    if (result.moved_files.empty() && result.errors.empty()) {
        return;
    }

    auto now = RoomState::Clock::now();
    room_.mutate([&](RoomData& room) {
        if (auto* found = room.find(name); found && !result.moved_files.empty()) {
            found->file_path = result.moved_files.front();
        }
        for (const auto& error : result.errors) {
            room.record({name, "organizer", now, error});
        }
    });
}

std::expected<std::string, std::string> DownloadQueue::resolve(const Item& item) {
    std::string context = item.listing_url;
    if (context.empty()) {
        context = room_.inspect([](const RoomData& room) { return room.listing_url; });
    }
    if (context.empty()) {
        return std::unexpected("No listing URL to resolve " + item.name + " against");
    }

    try {
        auto listing = catalog_.scrape(context);
        if (!listing) {
            return std::unexpected("Resolve failed: " + listing.error().message());
        }
        for (const auto& entry : *listing) {
            if (entry.name == item.name && entry.download_url && !entry.download_url->empty()) {
                return *entry.download_url;
            }
        }
        return std::unexpected(item.name + " is not listed at " + context);
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Resolve failed: ") + e.what());
    }
}

} // namespace roomdl::queue
