// Copyright (c) 2026 changcheng967. All rights reserved.

#include <roomdl/organizer/ruleset_organizer.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>

namespace roomdl::organizer {

namespace {

constexpr std::size_t READ_BLOCK_SIZE = 64 * 1024;

using ArchivePtr = std::unique_ptr<archive, int (*)(archive*)>;

std::error_code archive_failure(archive* handle, const std::filesystem::path& path) {
    const char* detail = archive_error_string(handle);
    spdlog::warn("Extracting {} failed: {}", path.string(), detail ? detail : "unknown error");
    return make_error_code(OrganizerErrc::corrupted_archive);
}

// Members are joined onto the destination directory
bool is_safe_member(const std::filesystem::path& member) {
    if (member.empty() || member.has_root_path()) {
        return false;
    }
    return std::none_of(member.begin(), member.end(),
                        [](const std::filesystem::path& part) { return part == ".."; });
}

// Returns the handle that failed, nullptr once the entry's data is copied
archive* copy_entry_data(archive* reader, archive* writer) {
    const void* block = nullptr;
    std::size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int rc = archive_read_data_block(reader, &block, &size, &offset);
        if (rc == ARCHIVE_EOF) {
            return nullptr;
        }
        if (rc < ARCHIVE_OK) {
            return reader;
        }
        if (archive_write_data_block(writer, block, size, offset) < ARCHIVE_OK) {
            return writer;
        }
    }
}

std::string lower_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// rename(2), falling back to copy and delete across filesystems
std::error_code move_file(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return ec;
    }
    ec.clear();
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return ec;
    }
    std::filesystem::remove(from, ec);
    return ec;
}

// Drops extracted/<stem> and extracted/ itself once it is empty
void remove_extract_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        spdlog::warn("Could not clean up {}: {}", dir.string(), ec.message());
        return;
    }
    if (std::filesystem::is_empty(dir.parent_path(), ec) && !ec) {
        std::filesystem::remove(dir.parent_path(), ec);
    }
}

} // namespace

void to_json(nlohmann::json& j, const Ruleset& ruleset) {
    j = nlohmann::json{
        {"name", ruleset.name},
        {"extract", ruleset.extract},
        {"move", ruleset.move},
        {"rename", ruleset.rename},
    };
}

void from_json(const nlohmann::json& j, Ruleset& ruleset) {
    ruleset.name = j.at("name").get<std::string>();
    ruleset.extract = j.value("extract", false);
    ruleset.move = j.value("move", std::string{});
    ruleset.rename = j.value("rename", std::string{});
}

//=============================================================================
// RulesetStore
//=============================================================================

RulesetStore::RulesetStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::vector<Ruleset> RulesetStore::defaults() {
    return {
        {"n64", true, "./organized/n64", "{name}.z64"},
        {"psx", true, "./organized/psx", "{name}.bin"},
        {"gba", true, "./organized/gba", "{name}.gba"},
    };
}

std::expected<std::vector<Ruleset>, std::error_code> RulesetStore::list() const {
    std::lock_guard lock(mutex_);
    return load_locked();
}

std::expected<Ruleset, std::error_code> RulesetStore::get(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto rulesets = load_locked();
    if (!rulesets) {
        return std::unexpected(rulesets.error());
    }
    auto it = std::find_if(rulesets->begin(), rulesets->end(),
                           [&](const Ruleset& r) { return r.name == name; });
    if (it == rulesets->end()) {
        return std::unexpected(make_error_code(OrganizerErrc::ruleset_not_found));
    }
    return *it;
}

std::error_code RulesetStore::add(const Ruleset& ruleset) {
    if (ruleset.name.empty()) {
        return make_error_code(OrganizerErrc::invalid_ruleset);
    }
    std::lock_guard lock(mutex_);
    auto rulesets = load_locked();
    if (!rulesets) {
        return rulesets.error();
    }
    if (std::any_of(rulesets->begin(), rulesets->end(), [&](const Ruleset& r) { return r.name == ruleset.name; })) {
        return make_error_code(OrganizerErrc::ruleset_exists);
    }
    rulesets->push_back(ruleset);
    return save_locked(*rulesets);
}

std::error_code RulesetStore::update(std::string_view name, const Ruleset& ruleset) {
    std::lock_guard lock(mutex_);
    auto rulesets = load_locked();
    if (!rulesets) {
        return rulesets.error();
    }
    auto it = std::find_if(rulesets->begin(), rulesets->end(),
                           [&](const Ruleset& r) { return r.name == name; });
    if (it == rulesets->end()) {
        return make_error_code(OrganizerErrc::ruleset_not_found);
    }
    Ruleset updated = ruleset;
    if (updated.name.empty()) {
        updated.name = std::string(name);
    }
    if (updated.name != name &&
        std::any_of(rulesets->begin(), rulesets->end(), [&](const Ruleset& r) { return r.name == updated.name; })) {
        return make_error_code(OrganizerErrc::ruleset_exists);
    }
    *it = std::move(updated);
    return save_locked(*rulesets);
}

std::error_code RulesetStore::remove(std::string_view name) {
    std::lock_guard lock(mutex_);
    auto rulesets = load_locked();
    if (!rulesets) {
        return rulesets.error();
    }
    auto it = std::find_if(rulesets->begin(), rulesets->end(),
                           [&](const Ruleset& r) { return r.name == name; });
    if (it == rulesets->end()) {
        return make_error_code(OrganizerErrc::ruleset_not_found);
    }
    rulesets->erase(it);
    return save_locked(*rulesets);
}

std::expected<std::vector<Ruleset>, std::error_code> RulesetStore::load_locked() const {
    try {
        if (!std::filesystem::exists(path_)) {
            auto seeded = defaults();
            if (auto ec = save_locked(seeded); ec) {
                spdlog::warn("Could not seed rulesets at {}: {}", path_.string(), ec.message());
            }
            return seeded;
        }

        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(OrganizerErrc::store_unreadable));
        }
        auto j = nlohmann::json::parse(file);
        return j.value("rulesets", std::vector<Ruleset>{});
    } catch (const std::exception& e) {
        spdlog::error("Reading rulesets from {} failed: {}", path_.string(), e.what());
        return std::unexpected(make_error_code(OrganizerErrc::store_unreadable));
    }
}

std::error_code RulesetStore::save_locked(const std::vector<Ruleset>& rulesets) const {
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }
        std::ofstream file(path_, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_error_code(OrganizerErrc::store_unwritable);
        }
        file << nlohmann::json{{"rulesets", rulesets}}.dump(2);
        if (!file.flush()) {
            return make_error_code(OrganizerErrc::store_unwritable);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Writing rulesets to {} failed: {}", path_.string(), e.what());
        return make_error_code(OrganizerErrc::store_unwritable);
    }
}

//=============================================================================
// Helpers
//=============================================================================

std::string format_file_name(std::string_view pattern, std::string_view file_name) {
    std::filesystem::path original{std::string(file_name)};
    std::string stem = original.stem().string();
    std::string ext = original.extension().string();

    std::string result;
    constexpr std::string_view token = "{name}";
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        auto hit = pattern.find(token, pos);
        if (hit == std::string_view::npos) {
            result.append(pattern.substr(pos));
            break;
        }
        result.append(pattern.substr(pos, hit - pos));
        result += stem;
        pos = hit + token.size();
    }

    std::string template_ext = std::filesystem::path{std::string(pattern)}.extension().string();
    const std::string& final_ext = template_ext.empty() ? ext : template_ext;
    if (!final_ext.empty() && !result.ends_with(final_ext)) {
        result += final_ext;
    }
    return result;
}

std::expected<std::vector<std::filesystem::path>, std::error_code>
extract_zip(const std::filesystem::path& archive_path, const std::filesystem::path& destination) {
    ArchivePtr reader(archive_read_new(), &archive_read_free);
    ArchivePtr writer(archive_write_disk_new(), &archive_write_free);
    if (!reader || !writer) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }

    archive_read_support_format_zip(reader.get());
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_filename(reader.get(), archive_path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return std::unexpected(archive_failure(reader.get(), archive_path));
    }

    std::error_code ec;
    auto root = std::filesystem::absolute(destination, ec).lexically_normal();
    if (!ec) {
        std::filesystem::create_directories(root, ec);
    }
    if (ec) {
        return std::unexpected(ec);
    }

    std::vector<std::filesystem::path> extracted;
    for (;;) {
        archive_entry* entry = nullptr;
        int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            return std::unexpected(archive_failure(reader.get(), archive_path));
        }
        // Directories are created on demand, links are not followed
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }

        const char* name = archive_entry_pathname(entry);
        if (!name || !is_safe_member(name)) {
            spdlog::warn("Refusing member '{}' of {}", name ? name : "", archive_path.string());
            return std::unexpected(make_error_code(OrganizerErrc::corrupted_archive));
        }

        auto target = root / std::filesystem::path(name);
        archive_entry_set_pathname(entry, target.c_str());
        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
            return std::unexpected(archive_failure(writer.get(), archive_path));
        }
        if (archive* failed = copy_entry_data(reader.get(), writer.get())) {
            return std::unexpected(archive_failure(failed, archive_path));
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            return std::unexpected(archive_failure(writer.get(), archive_path));
        }
        extracted.push_back(std::move(target));
    }

    if (archive_write_close(writer.get()) < ARCHIVE_WARN) {
        return std::unexpected(archive_failure(writer.get(), archive_path));
    }
    return extracted;
}

//=============================================================================
// RulesetOrganizer
//=============================================================================

RulesetOrganizer::RulesetOrganizer(RulesetStore& store)
    : store_(store) {}

OrganizeResult RulesetOrganizer::apply(const std::string& ruleset_name, const std::string& file_path) {
    OrganizeResult result;

    auto ruleset = store_.get(ruleset_name);
    if (!ruleset) {
        result.errors.push_back("Ruleset '" + ruleset_name + "': " + ruleset.error().message());
        return result;
    }

    std::filesystem::path source(file_path);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        result.errors.push_back(file_path + ": " + (ec ? ec.message() : std::string("not a regular file")));
        return result;
    }

    std::vector<std::filesystem::path> files{source};
    std::filesystem::path extract_dir;

    if (ruleset->extract && lower_extension(source) == ".zip") {
        extract_dir = source.parent_path() / "extracted" / source.stem();
        auto members = extract_zip(source, extract_dir);
        if (!members) {
            remove_extract_dir(extract_dir);
            result.errors.push_back(source.filename().string() + ": " + members.error().message());
            return result;
        }
        spdlog::info("Extracted {} files from {}", members->size(), source.filename().string());
        for (const auto& member : *members) {
            result.extracted_files.push_back(member.string());
        }
        files = std::move(*members);
    }

    if (ruleset->move.empty() && ruleset->rename.empty()) {
        return result;
    }

    std::filesystem::path move_dir;
    if (!ruleset->move.empty()) {
        move_dir = std::filesystem::absolute(ruleset->move, ec);
        if (!ec) {
            std::filesystem::create_directories(move_dir, ec);
        }
        if (ec) {
            result.errors.push_back(ruleset->move + ": " + ec.message());
            return result;
        }
    }

    for (const auto& file : files) {
        std::string file_name = file.filename().string();
        std::string target_name = ruleset->rename.empty() ? file_name : format_file_name(ruleset->rename, file_name);
        auto target = (move_dir.empty() ? file.parent_path() : move_dir) / target_name;

        if (auto move_ec = move_file(file, target); move_ec) {
            result.errors.push_back(make_error_code(OrganizerErrc::move_failed).message() + " " +
                                    file_name + ": " + move_ec.message());
            continue;
        }
        spdlog::info("Organized {} -> {}", file_name, target.string());
        result.moved_files.push_back(target.string());
    }

    // Everything unpacked has been moved out
    if (!extract_dir.empty() && result.errors.empty() && !move_dir.empty()) {
        remove_extract_dir(extract_dir);
    }
    return result;
}

std::vector<OrganizeResult> RulesetOrganizer::apply_all(const std::string& ruleset,
                                                        const std::vector<std::string>& file_paths) {
    std::vector<OrganizeResult> results;
    results.reserve(file_paths.size());
    for (const auto& path : file_paths) {
        results.push_back(apply(ruleset, path));
    }
    return results;
}

} // namespace roomdl::organizer
