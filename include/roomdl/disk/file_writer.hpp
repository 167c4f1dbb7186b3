// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace roomdl::disk {

// Sequential writer for one download. Bytes go to "<final>.part"; commit()
// renames it over the final path, discard() unlinks it. A writer destroyed
// without commit() discards, so a truncated file never takes the final name.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create parent directories and open "<final_path><suffix>" truncated
    [[nodiscard]] std::error_code open(std::string_view final_path, std::string_view suffix) noexcept;

    // Append data, retrying short writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // fsync, close and rename the temporary over the final path
    [[nodiscard]] std::error_code commit() noexcept;

    // Close and remove the temporary file
    void discard() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t written() const noexcept { return written_; }
    [[nodiscard]] const std::string& path() const noexcept { return final_path_; }
    [[nodiscard]] const std::string& temp_path() const noexcept { return temp_path_; }

private:
    void close_fd() noexcept;

    int fd_{-1};
    std::uint64_t written_{0};
    std::string final_path_;
    std::string temp_path_;
};

} // namespace roomdl::disk
