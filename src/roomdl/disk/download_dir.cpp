// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/disk/download_dir.hpp>
#include <roomdl/core/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace roomdl::disk {

std::expected<std::vector<CompletedFile>, std::error_code>
list_completed(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;

    std::vector<CompletedFile> files;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (ec) {
            return std::unexpected(ec);
        }
        return files;
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (!entry.is_regular_file(ec) || entry.path().extension() == core::PART_SUFFIX) {
            continue;
        }

        CompletedFile file;
        file.name = entry.path().filename().string();
        file.path = entry.path();
        file.size = entry.file_size(ec);
        if (ec) {
            // Removed or renamed while listing
            spdlog::debug("Skipping {}: {}", file.name, ec.message());
            continue;
        }
        auto mtime = entry.last_write_time(ec);
        if (ec) {
            spdlog::debug("Skipping {}: {}", file.name, ec.message());
            continue;
        }
        file.modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(mtime));
        files.push_back(std::move(file));
    }
    if (ec) {
        return std::unexpected(ec);
    }

    std::sort(files.begin(), files.end(), [](const CompletedFile& a, const CompletedFile& b) {
        if (a.modified != b.modified) {
            return a.modified > b.modified;
        }
        return a.name < b.name;
    });
    return files;
}

} // namespace roomdl::disk
