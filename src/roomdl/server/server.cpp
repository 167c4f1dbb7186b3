// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/server/server.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>

namespace roomdl::server {

namespace {

constexpr std::size_t BLOCKING_THREADS = 2;

} // namespace

Server::Server(Settings settings)
    : settings_(std::move(settings))
    , room_(channel_, settings_.idle_timeout)
    , store_(settings_.state_file)
    , transfer_(settings_.transfer_options())
    , catalog_(settings_.transfer_options(), settings_.extensions)
    , rulesets_(settings_.rulesets_file)
    , organizer_(rulesets_)
    , queue_(room_, channel_, transfer_, catalog_, &organizer_, settings_.download_dir)
    , io_context_(static_cast<int>(settings_.threads))
    , blocking_(BLOCKING_THREADS)
    , acceptor_(io_context_)
    , signals_(io_context_)
    , sweep_timer_(io_context_)
    , save_timer_(io_context_) {
    const auto address = asio::ip::make_address(settings_.address);
    const asio::ip::tcp::endpoint endpoint(address, settings_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    spdlog::info("Listening on {}:{}, downloads go to {}",
                 settings_.address, settings_.port, settings_.download_dir.string());

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& ec, int) {
        if (!ec) {
            spdlog::info("Signal received, shutting down");
            stop();
        }
    });

    restore_state();
}

Server::~Server() {
    queue_.shutdown();
    blocking_.stop();
    blocking_.join();
}

void Server::run() {
    accept_next();
    schedule_sweep();
    schedule_save();

    const auto worker_count = settings_.threads;
    workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
    for (std::size_t i = 1; i < worker_count; ++i) {
        workers_.emplace_back([this] { io_context_.run(); });
    }
    spdlog::info("Server event loop running with {} threads", worker_count);
    io_context_.run();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    queue_.shutdown();
    save_state();
    spdlog::info("Server stopped");
}

void Server::stop() {
    asio::post(io_context_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        save_timer_.cancel();
        signals_.cancel(ec);
        io_context_.stop();
    });
}

void Server::restore_state() {
    auto loaded = store_.load();
    if (!loaded) {
        spdlog::warn("Starting with an empty room: {}", loaded.error().message());
        loaded = queue::RoomData{};
    }
    if (loaded->ruleset.empty()) {
        loaded->ruleset = settings_.ruleset;
    }

    bool pending = std::any_of(loaded->items.begin(), loaded->items.end(),
                               [](const queue::Item& item) { return item.status == queue::ItemStatus::available; });
    spdlog::info("Restored {} items from {}", loaded->items.size(), store_.path().string());
    room_.reset(std::move(*loaded));

    if (pending) {
        queue_.start_processing();
    }
}

void Server::save_state() {
    if (auto ec = store_.save(room_.snapshot()); ec) {
        spdlog::error("Could not save room state: {}", ec.message());
    }
}

void Server::accept_next() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, asio::ip::tcp::socket socket) {
        on_accept(ec, std::move(socket));
    });
}

void Server::on_accept(const boost::system::error_code& ec, asio::ip::tcp::socket socket) {
    if (!ec) {
        SessionServices services{room_, queue_, channel_, catalog_, rulesets_, organizer_, blocking_,
                                 settings_.download_dir};
        auto session = std::make_shared<Session>(std::move(socket), std::move(services));
        session->start();
    }
    if (!ec || ec == asio::error::operation_aborted) {
        if (acceptor_.is_open()) {
            accept_next();
        }
    } else {
        spdlog::error("Accept error: {}", ec.message());
        accept_next();
    }
}

void Server::schedule_sweep() {
    sweep_timer_.expires_after(settings_.idle_sweep_interval);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        room_.idle_sweep(queue::RoomState::Clock::now());
        schedule_sweep();
    });
}

void Server::schedule_save() {
    save_timer_.expires_after(settings_.save_interval);
    save_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        save_state();
        schedule_save();
    });
}

} // namespace roomdl::server
