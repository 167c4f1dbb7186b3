// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/queue/download_queue.hpp>
#include <roomdl/queue/room_state.hpp>
#include <roomdl/catalog/catalog.hpp>
#include <roomdl/organizer/ruleset_organizer.hpp>
#include <roomdl/notify/channel.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace roomdl::server {

namespace asio = boost::asio;

struct SessionServices {
    queue::RoomState& room;
    queue::DownloadQueue& queue;
    notify::Channel& channel;
    catalog::Catalog& catalog;
    organizer::RulesetStore& rulesets;
    organizer::RulesetOrganizer& organizer;
    asio::thread_pool& blocking;         // Scrapes, resolves and organizing run here
    std::filesystem::path download_dir;
};

// Wire name of an error code, e.g. "not_found"
[[nodiscard]] std::string error_name(const std::error_code& ec);

// Failed request as reported to the client
struct RequestError {
    std::string code;
    std::string message;

    RequestError(std::string c, std::string m) : code(std::move(c)), message(std::move(m)) {}
    explicit RequestError(const std::error_code& ec) : code(error_name(ec)), message(ec.message()) {}
};

using Reply = std::expected<nlohmann::json, RequestError>;

// Build the response envelope for request id
[[nodiscard]] nlohmann::json make_response(const nlohmann::json& id, const Reply& reply);

// One client connection. Reads framed requests, answers them and forwards
// room pushes. All socket work happens on the session's strand.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::ip::tcp::socket socket, SessionServices services);
    ~Session();

    void start();
    void stop();

    // Queue a message for writing, callable from any thread
    void send(nlohmann::json message);

private:
    void read_frame_header();
    void read_frame_payload(std::uint32_t size);
    void process_message(const nlohmann::json& request);
    void on_event(const notify::Event& event);
    enum class FrameKind { reply, room_update, progress };

    struct PendingFrame {
        std::vector<std::uint8_t> bytes;
        FrameKind kind;
    };

    void queue_frame(std::vector<std::uint8_t> frame, FrameKind kind);
    void write_next();

    [[nodiscard]] Reply handle(const std::string& op, const nlohmann::json& request);
    [[nodiscard]] Reply handle_enqueue(const nlohmann::json& request);
    [[nodiscard]] Reply handle_scrape(const nlohmann::json& request);
    [[nodiscard]] Reply handle_organize(const nlohmann::json& request);
    [[nodiscard]] Reply handle_save_ruleset(const nlohmann::json& request);
    [[nodiscard]] Reply handle_set_ruleset(const nlohmann::json& request);
    [[nodiscard]] Reply handle_completed();

    [[nodiscard]] std::string remote_endpoint() const;

    asio::ip::tcp::socket socket_;
    asio::strand<asio::any_io_executor> strand_;
    asio::strand<asio::thread_pool::executor_type> work_strand_;   // Keeps one client's requests in order
    SessionServices services_;
    std::string peer_;

    std::array<std::uint8_t, 4> header_buffer_{};
    std::vector<std::uint8_t> buffer_;
    std::deque<PendingFrame> write_queue_;      // front() is in flight while writing_
    bool writing_{false};
    bool closed_{false};
    std::optional<notify::Channel::SubscriptionId> subscription_;
};

} // namespace roomdl::server
