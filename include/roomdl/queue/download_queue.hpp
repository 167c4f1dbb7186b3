// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/queue/error.hpp>
#include <roomdl/queue/item.hpp>
#include <roomdl/queue/room_state.hpp>
#include <roomdl/core/error.hpp>
#include <roomdl/core/transfer.hpp>
#include <roomdl/catalog/catalog.hpp>
#include <roomdl/organizer/organizer.hpp>
#include <roomdl/notify/channel.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace roomdl::queue {

struct EnqueueRequest {
    std::string name;
    std::string size;
    std::string download_url;
};

struct EnqueueResult {
    std::size_t added{0};
    std::size_t already_queued{0};
    std::size_t rejected{0};          // Empty or path-like names
};

// Terminal status for a failed transfer
[[nodiscard]] ItemStatus classify(const core::TransferError& error) noexcept;

// Plain file name, no separators and not "." or ".."
[[nodiscard]] bool is_valid_item_name(std::string_view name) noexcept;

// Ordered items drained by a single sequential worker thread
class DownloadQueue {
public:
    DownloadQueue(RoomState& room,
                  notify::Channel& channel,
                  core::Transfer& transfer,
                  catalog::Catalog& catalog,
                  organizer::Organizer* organizer,
                  std::filesystem::path download_dir);
    ~DownloadQueue();

    DownloadQueue(const DownloadQueue&) = delete;
    DownloadQueue& operator=(const DownloadQueue&) = delete;

    // Append new items. Names already available or downloading are left
    // alone, names in a terminal state are replaced at the back.
    EnqueueResult enqueue(const std::vector<EnqueueRequest>& requests, std::string_view listing_url = {});

    // Start the worker unless one is already running
    void start_processing();

    [[nodiscard]] std::error_code cancel(std::string_view name);
    [[nodiscard]] std::error_code retry(std::string_view name);
    [[nodiscard]] std::error_code remove(std::string_view name);
    std::size_t retry_all_failed();

    void set_ruleset(std::string name);
    void set_listing_url(std::string url);

    // Stop the worker, aborting any transfer. The interrupted item goes
    // back to available so a later run picks it up again.
    void shutdown();

    [[nodiscard]] bool is_processing() const noexcept { return running_.load(std::memory_order_acquire); }

    // Block until the worker has drained the queue or timeout expires
    bool wait_idle(std::chrono::milliseconds timeout);

    [[nodiscard]] const std::filesystem::path& download_dir() const noexcept { return download_dir_; }

private:
    void worker_loop(std::stop_token stop);
    [[nodiscard]] std::optional<Item> claim_next();
    void process(Item item, std::stop_token worker_stop);
    void finish_success(const Item& item, const std::string& path, std::uint64_t bytes);
    void finish_failure(const Item& item, ItemStatus status, const std::string& reason);
    void run_organizer(const std::string& name, const std::string& path, const std::string& ruleset);

    // Look the item up in its listing, yields the download URL or a reason
    [[nodiscard]] std::expected<std::string, std::string> resolve(const Item& item);

    RoomState& room_;
    notify::Channel& channel_;
    core::Transfer& transfer_;
    catalog::Catalog& catalog_;
    organizer::Organizer* organizer_;
    std::filesystem::path download_dir_;

    std::mutex worker_mutex_;
    std::condition_variable idle_cv_;
    std::jthread worker_;
    std::atomic<bool> running_{false};
    bool shut_down_{false};

    std::mutex active_mutex_;
    std::string active_name_;
    std::stop_source active_stop_{std::nostopstate};
};

} // namespace roomdl::queue
