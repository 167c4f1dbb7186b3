// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace roomdl::disk {

namespace {

struct DiskCategory : std::error_category {
    const char* name() const noexcept override { return "roomdl::disk"; }

    std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::not_found:         return "no such file or directory";
            case DiskErrc::permission_denied: return "permission denied";
            case DiskErrc::no_space:          return "no space left on device";
            case DiskErrc::bad_path:          return "path is not a writable file location";
            case DiskErrc::already_exists:    return "file already exists";
            case DiskErrc::write_failed:      return "write to part file failed";
            case DiskErrc::rename_failed:     return "could not move part file into place";
            case DiskErrc::not_open:          return "writer is not open";
        }
        return "unknown disk error";
    }
};

} // namespace

const std::error_category& disk_category() noexcept {
    static const DiskCategory category;
    return category;
}

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:       return make_error_code(DiskErrc::not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::permission_denied);
        case ENOSPC:
        case EDQUOT:       return make_error_code(DiskErrc::no_space);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:       return make_error_code(DiskErrc::bad_path);
        case EEXIST:       return make_error_code(DiskErrc::already_exists);
        case EBADF:        return make_error_code(DiskErrc::not_open);
        default:           return make_error_code(fallback);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    if (is_open()) {
        discard();
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , written_(std::exchange(other.written_, 0))
    , final_path_(std::move(other.final_path_))
    , temp_path_(std::move(other.temp_path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (is_open()) discard();
        fd_ = std::exchange(other.fd_, -1);
        written_ = std::exchange(other.written_, 0);
        final_path_ = std::move(other.final_path_);
        temp_path_ = std::move(other.temp_path_);
    }
    return *this;
}

std::error_code FileWriter::open(std::string_view final_path, std::string_view suffix) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::already_exists);
    }
    if (final_path.empty()) {
        return make_error_code(DiskErrc::bad_path);
    }

    try {
        final_path_ = std::string(final_path);
        temp_path_ = final_path_ + std::string(suffix);

        // Create parent directories if they don't exist
        std::filesystem::path p(final_path_);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                return from_errno(ec.value(), DiskErrc::bad_path);
            }
        }
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    fd_ = ::open(temp_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return from_errno(errno, DiskErrc::write_failed);
    }
    written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::not_open);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno, DiskErrc::write_failed);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::commit() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::not_open);
    }

    if (::fsync(fd_) != 0) {
        auto ec = from_errno(errno, DiskErrc::write_failed);
        discard();
        return ec;
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        auto ec = from_errno(errno, DiskErrc::write_failed);
        discard();
        return ec;
    }
    fd_ = -1;

    if (std::rename(temp_path_.c_str(), final_path_.c_str()) != 0) {
        auto ec = from_errno(errno, DiskErrc::rename_failed);
        discard();
        return ec;
    }
    return {};
}

void FileWriter::discard() noexcept {
    close_fd();
    if (!temp_path_.empty()) {
        if (::unlink(temp_path_.c_str()) != 0 && errno != ENOENT) {
            spdlog::warn("Could not remove partial file {}: {}", temp_path_, std::strerror(errno));
        }
    }
    written_ = 0;
}

void FileWriter::close_fd() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace roomdl::disk
