// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/server/session.hpp>
#include <roomdl/core/error.hpp>
#include <roomdl/core/units.hpp>
#include <roomdl/disk/download_dir.hpp>
#include <roomdl/queue/error.hpp>
#include <roomdl/notify/framing.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <variant>

namespace roomdl::server {

namespace {

constexpr std::size_t MAX_PENDING_FRAMES = 256;   // Past this, progress pushes are dropped
constexpr std::size_t MAX_QUEUED_FRAMES = 1024;   // Past this, the client is not reading and is dropped

std::uint32_t read_u32_be(const std::array<std::uint8_t, 4>& buffer) noexcept {
    return (static_cast<std::uint32_t>(buffer[0]) << 24) | (static_cast<std::uint32_t>(buffer[1]) << 16) |
           (static_cast<std::uint32_t>(buffer[2]) << 8) | static_cast<std::uint32_t>(buffer[3]);
}

std::string_view transfer_errc_name(core::TransferErrc e) noexcept {
    using core::TransferErrc;
    switch (e) {
        case TransferErrc::network_error:      return "network_error";
        case TransferErrc::timeout:            return "timeout";
        case TransferErrc::http_status:        return "http_status";
        case TransferErrc::too_many_redirects: return "too_many_redirects";
        case TransferErrc::missing_source:     return "missing_source";
        case TransferErrc::cancelled:          return "cancelled";
        case TransferErrc::io_error:           return "io_error";
        case TransferErrc::truncated:          return "truncated";
        case TransferErrc::invalid_url:        return "invalid_url";
        case TransferErrc::dns_error:          return "dns_error";
        case TransferErrc::refused:            return "refused";
        case TransferErrc::ssl_error:          return "ssl_error";
        default:                               return "internal";
    }
}

std::string_view queue_errc_name(queue::QueueErrc e) noexcept {
    using queue::QueueErrc;
    switch (e) {
        case QueueErrc::not_found:        return "not_found";
        case QueueErrc::invalid_state:    return "invalid_state";
        case QueueErrc::resolve_failed:   return "resolve_failed";
        case QueueErrc::invalid_name:     return "invalid_name";
        case QueueErrc::state_unreadable:
        case QueueErrc::state_unwritable: return "storage";
        default:                          return "internal";
    }
}

std::string_view organizer_errc_name(organizer::OrganizerErrc e) noexcept {
    using organizer::OrganizerErrc;
    switch (e) {
        case OrganizerErrc::ruleset_not_found: return "ruleset_not_found";
        case OrganizerErrc::ruleset_exists:    return "ruleset_exists";
        case OrganizerErrc::invalid_ruleset:   return "invalid_ruleset";
        case OrganizerErrc::corrupted_archive: return "corrupted_archive";
        case OrganizerErrc::move_failed:       return "move_failed";
        case OrganizerErrc::store_unreadable:
        case OrganizerErrc::store_unwritable:  return "storage";
        default:                               return "internal";
    }
}

RequestError bad_request(std::string message) {
    return RequestError("bad_request", std::move(message));
}

RequestError from_transfer_error(const core::TransferError& error) {
    return RequestError(error_name(error.code), error.message());
}

// Throws json::type_error for a missing or non-string field
const std::string& require_string(const nlohmann::json& request, const char* key) {
    return request.at(key).get_ref<const std::string&>();
}

} // namespace

std::string error_name(const std::error_code& ec) {
    if (ec.category() == core::transfer_errc_category()) {
        return std::string(transfer_errc_name(static_cast<core::TransferErrc>(ec.value())));
    }
    if (ec.category() == queue::queue_errc_category()) {
        return std::string(queue_errc_name(static_cast<queue::QueueErrc>(ec.value())));
    }
    if (ec.category() == organizer::organizer_errc_category()) {
        return std::string(organizer_errc_name(static_cast<organizer::OrganizerErrc>(ec.value())));
    }
    return "internal";
}

nlohmann::json make_response(const nlohmann::json& id, const Reply& reply) {
    nlohmann::json response{
        {"type", "response"},
        {"id", id},
        {"ok", reply.has_value()},
    };
    if (reply) {
        if (reply->is_object()) {
            for (const auto& [key, value] : reply->items()) {
                response[key] = value;
            }
        }
    } else {
        response["error"] = nlohmann::json{
            {"code", reply.error().code},
            {"message", reply.error().message},
        };
    }
    return response;
}

//=============================================================================
// Session
//=============================================================================

Session::Session(asio::ip::tcp::socket socket, SessionServices services)
    : socket_(std::move(socket))
    , strand_(asio::make_strand(socket_.get_executor()))
    , work_strand_(asio::make_strand(services.blocking.get_executor()))
    , services_(std::move(services))
    , peer_(remote_endpoint()) {}

Session::~Session() {
    if (subscription_) {
        services_.channel.unsubscribe(*subscription_);
    }
}

void Session::start() {
    spdlog::info("Client connected from {}", peer_);

    std::weak_ptr<Session> weak = shared_from_this();
    subscription_ = services_.room.connect([weak](const notify::Event& event) {
        if (auto self = weak.lock()) {
            self->on_event(event);
        }
    });

    asio::post(strand_, [self = shared_from_this()] { self->read_frame_header(); });
}

void Session::stop() {
    asio::post(strand_, [self = shared_from_this()] {
        if (self->closed_) {
            return;
        }
        self->closed_ = true;
        if (self->subscription_) {
            self->services_.channel.unsubscribe(*self->subscription_);
            self->subscription_.reset();
        }
        boost::system::error_code ec;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        self->socket_.close(ec);
        // An in-flight write still references front(), its handler clears the rest
        if (!self->writing_) {
            self->write_queue_.clear();
        }
        spdlog::info("Client {} disconnected", self->peer_);
    });
}

void Session::send(nlohmann::json message) {
    std::vector<std::uint8_t> frame;
    try {
        frame = notify::encode_frame(message);
    } catch (const std::exception& e) {
        spdlog::error("Dropping reply to {}: {}", peer_, e.what());
        return;
    }
    asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        self->queue_frame(std::move(frame), FrameKind::reply);
    });
}

void Session::on_event(const notify::Event& event) {
    // Called under the room lock, serialize on the strand instead
    asio::post(strand_, [self = shared_from_this(), event]() {
        if (self->closed_) {
            return;
        }
        auto kind = std::holds_alternative<notify::FileProgress>(event) ? FrameKind::progress : FrameKind::room_update;
        try {
            self->queue_frame(notify::encode_frame(notify::to_message(event)), kind);
        } catch (const std::exception& e) {
            spdlog::error("Dropping push to {}: {}", self->peer_, e.what());
        }
    });
}

void Session::read_frame_header() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_buffer_),
        asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                stop();
                return;
            }
            const std::uint32_t payload_size = read_u32_be(header_buffer_);
            if (payload_size == 0) {
                read_frame_header();
                return;
            }
            if (payload_size > notify::MAX_FRAME_SIZE) {
                spdlog::warn("Client {} sent a {} byte frame, closing", peer_, payload_size);
                stop();
                return;
            }
            read_frame_payload(payload_size);
        }));
}

void Session::read_frame_payload(std::uint32_t size) {
    buffer_.resize(size);
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(buffer_),
        asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec) {
                stop();
                return;
            }
            auto request = nlohmann::json::parse(buffer_.begin(), buffer_.end(), nullptr, false);
            if (request.is_discarded() || !request.is_object()) {
                send(make_response(nullptr, std::unexpected(bad_request("Request must be a JSON object"))));
            } else {
                process_message(request);
            }
            read_frame_header();
        }));
}

void Session::process_message(const nlohmann::json& request) {
    auto id = request.contains("id") ? request.at("id") : nlohmann::json(nullptr);
    auto op = request.value("op", std::string{});

    asio::post(work_strand_, [self = shared_from_this(), request, id, op] {
        Reply reply = std::unexpected(RequestError("internal", "Unhandled request"));
        try {
            reply = self->handle(op, request);
        } catch (const nlohmann::json::exception& e) {
            reply = std::unexpected(bad_request(e.what()));
        } catch (const std::exception& e) {
            spdlog::error("Request {} from {} failed: {}", op, self->peer_, e.what());
            reply = std::unexpected(RequestError("internal", e.what()));
        }
        self->send(make_response(id, reply));
    });
}

void Session::queue_frame(std::vector<std::uint8_t> frame, FrameKind kind) {
    if (closed_) {
        return;
    }

    if (kind == FrameKind::progress && write_queue_.size() >= MAX_PENDING_FRAMES) {
        return;
    }

    // A room update carries the whole room, so a queued one is simply replaced
    if (kind == FrameKind::room_update) {
        auto first = write_queue_.begin() + (writing_ ? 1 : 0);
        auto queued = std::find_if(first, write_queue_.end(),
                                   [](const PendingFrame& f) { return f.kind == FrameKind::room_update; });
        if (queued != write_queue_.end()) {
            queued->bytes = std::move(frame);
            return;
        }
    }

    if (write_queue_.size() >= MAX_QUEUED_FRAMES) {
        spdlog::warn("Client {} has {} unsent frames, closing", peer_, write_queue_.size());
        stop();
        return;
    }

    write_queue_.push_back({std::move(frame), kind});
    if (!writing_) {
        write_next();
    }
}

void Session::write_next() {
    if (closed_) {
        write_queue_.clear();
        writing_ = false;
        return;
    }
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front().bytes),
        asio::bind_executor(strand_, [this, self](const boost::system::error_code& ec, std::size_t) {
            if (ec || closed_) {
                writing_ = false;
                write_queue_.clear();
                stop();
                return;
            }
            write_queue_.pop_front();
            write_next();
        }));
}

std::string Session::remote_endpoint() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

//=============================================================================
// Request handlers (run on the blocking pool)
//=============================================================================

Reply Session::handle(const std::string& op, const nlohmann::json& request) {
    spdlog::debug("{} -> {}", peer_, op);

    if (op == "enqueue") {
        return handle_enqueue(request);
    }
    if (op == "retry" || op == "remove" || op == "cancel") {
        const auto& name = require_string(request, "name");
        std::error_code ec = op == "retry"  ? services_.queue.retry(name)
                           : op == "remove" ? services_.queue.remove(name)
                                            : services_.queue.cancel(name);
        if (ec) {
            return std::unexpected(RequestError(ec));
        }
        return nlohmann::json::object();
    }
    if (op == "retryAllFailed") {
        return nlohmann::json{{"count", services_.queue.retry_all_failed()}};
    }
    if (op == "snapshot") {
        return nlohmann::json{{"room", services_.room.snapshot()}};
    }
    if (op == "scrape") {
        return handle_scrape(request);
    }
    if (op == "rulesets") {
        auto rulesets = services_.rulesets.list();
        if (!rulesets) {
            return std::unexpected(RequestError(rulesets.error()));
        }
        return nlohmann::json{{"rulesets", *rulesets}};
    }
    if (op == "saveRuleset") {
        return handle_save_ruleset(request);
    }
    if (op == "deleteRuleset") {
        if (auto ec = services_.rulesets.remove(require_string(request, "name")); ec) {
            return std::unexpected(RequestError(ec));
        }
        return nlohmann::json::object();
    }
    if (op == "setRuleset") {
        return handle_set_ruleset(request);
    }
    if (op == "organize") {
        return handle_organize(request);
    }
    if (op == "completedDownloads") {
        return handle_completed();
    }
    return std::unexpected(bad_request("Unknown op '" + op + "'"));
}

Reply Session::handle_enqueue(const nlohmann::json& request) {
    const auto& items = request.at("items");
    if (!items.is_array()) {
        return std::unexpected(bad_request("items must be an array"));
    }

    std::vector<queue::EnqueueRequest> requests;
    requests.reserve(items.size());
    for (const auto& entry : items) {
        queue::EnqueueRequest req;
        req.name = entry.value("name", std::string{});
        req.size = entry.value("size", std::string{});
        if (entry.contains("downloadUrl") && entry.at("downloadUrl").is_string()) {
            req.download_url = entry.at("downloadUrl").get<std::string>();
        }
        requests.push_back(std::move(req));
    }

    std::string listing_url = request.value("listingUrl", std::string{});
    auto result = services_.queue.enqueue(requests, listing_url);
    return nlohmann::json{
        {"added", result.added},
        {"alreadyQueued", result.already_queued},
        {"rejected", result.rejected},
    };
}

Reply Session::handle_scrape(const nlohmann::json& request) {
    const auto& url = require_string(request, "url");
    auto listing = services_.catalog.scrape(url);
    if (!listing) {
        return std::unexpected(from_transfer_error(listing.error()));
    }

    services_.queue.set_listing_url(url);

    nlohmann::json items = nlohmann::json::array();
    for (const auto& entry : *listing) {
        items.push_back(nlohmann::json{
            {"name", entry.name},
            {"downloadUrl", entry.download_url ? nlohmann::json(*entry.download_url) : nlohmann::json(nullptr)},
            {"size", entry.size ? nlohmann::json(*entry.size) : nlohmann::json(nullptr)},
        });
    }
    return nlohmann::json{{"items", std::move(items)}};
}

Reply Session::handle_save_ruleset(const nlohmann::json& request) {
    auto ruleset = request.at("ruleset").get<organizer::Ruleset>();
    auto existing = services_.rulesets.get(ruleset.name);
    std::error_code ec = existing ? services_.rulesets.update(ruleset.name, ruleset)
                                  : services_.rulesets.add(ruleset);
    if (ec) {
        return std::unexpected(RequestError(ec));
    }
    return nlohmann::json::object();
}

Reply Session::handle_set_ruleset(const nlohmann::json& request) {
    std::string name = request.value("name", std::string{});
    if (!name.empty()) {
        auto ruleset = services_.rulesets.get(name);
        if (!ruleset) {
            return std::unexpected(RequestError(ruleset.error()));
        }
    }
    services_.queue.set_ruleset(std::move(name));
    return nlohmann::json::object();
}

Reply Session::handle_completed() {
    auto files = disk::list_completed(services_.download_dir);
    if (!files) {
        return std::unexpected(RequestError(files.error()));
    }
    nlohmann::json out = nlohmann::json::array();
    for (const auto& file : *files) {
        out.push_back(nlohmann::json{
            {"name", file.name},
            {"filePath", file.path.string()},
            {"size", core::format_bytes(file.size)},
            {"sizeBytes", file.size},
            {"completedAt", queue::to_millis(file.modified)},
        });
    }
    return nlohmann::json{{"files", std::move(out)}};
}

Reply Session::handle_organize(const nlohmann::json& request) {
    const auto& ruleset = require_string(request, "ruleset");
    auto paths = request.at("paths").get<std::vector<std::string>>();

    if (auto found = services_.rulesets.get(ruleset); !found) {
        return std::unexpected(RequestError(found.error()));
    }

    // Only files under the download directory may be organized
    auto root = std::filesystem::weakly_canonical(services_.download_dir);
    std::vector<std::string> resolved;
    resolved.reserve(paths.size());
    for (const auto& path : paths) {
        std::filesystem::path p(path);
        if (p.is_relative()) {
            p = services_.download_dir / p;
        }
        auto canonical = std::filesystem::weakly_canonical(p);
        auto rel = canonical.lexically_relative(root);
        if (rel.empty() || rel == "." || *rel.begin() == "..") {
            return std::unexpected(bad_request(path + " is outside the download directory"));
        }
        resolved.push_back(canonical.string());
    }

    auto results = services_.organizer.apply_all(ruleset, resolved);
    nlohmann::json out = nlohmann::json::array();
    for (std::size_t i = 0; i < results.size(); ++i) {
        out.push_back(nlohmann::json{
            {"file", resolved[i]},
            {"extractedFiles", results[i].extracted_files},
            {"movedFiles", results[i].moved_files},
            {"errors", results[i].errors},
        });
    }
    return nlohmann::json{{"results", std::move(out)}};
}

} // namespace roomdl::server
