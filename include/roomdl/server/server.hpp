// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/server/settings.hpp>
#include <roomdl/server/session.hpp>
#include <roomdl/catalog/listing_scraper.hpp>
#include <roomdl/core/transfer.hpp>
#include <roomdl/notify/channel.hpp>
#include <roomdl/organizer/ruleset_organizer.hpp>
#include <roomdl/queue/download_queue.hpp>
#include <roomdl/queue/room_state.hpp>
#include <roomdl/queue/room_store.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <thread>
#include <vector>

namespace roomdl::server {

// The daemon: owns the room, the queue and its collaborators, and serves
// them to TCP clients
class Server {
public:
    explicit Server(Settings settings);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks until SIGINT/SIGTERM or stop()
    void run();
    void stop();

private:
    void restore_state();
    void save_state();
    void accept_next();
    void on_accept(const boost::system::error_code& ec, asio::ip::tcp::socket socket);
    void schedule_sweep();
    void schedule_save();

    Settings settings_;

    notify::Channel channel_;
    queue::RoomState room_;
    queue::RoomStore store_;
    core::HttpTransfer transfer_;
    catalog::ListingScraper catalog_;
    organizer::RulesetStore rulesets_;
    organizer::RulesetOrganizer organizer_;
    queue::DownloadQueue queue_;

    asio::io_context io_context_;
    asio::thread_pool blocking_;
    asio::ip::tcp::acceptor acceptor_;
    asio::signal_set signals_;
    asio::steady_timer sweep_timer_;
    asio::steady_timer save_timer_;

    std::vector<std::thread> workers_;
};

} // namespace roomdl::server
