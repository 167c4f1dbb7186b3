// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <roomdl/organizer/organizer.hpp>
#include <nlohmann/json_fwd.hpp>
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace roomdl::organizer {

enum class OrganizerErrc {
    success = 0,
    ruleset_not_found,
    ruleset_exists,
    invalid_ruleset,
    corrupted_archive,
    move_failed,
    store_unreadable,
    store_unwritable,
};

namespace detail {

struct OrganizerErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "roomdl::organizer";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<OrganizerErrc>(ev)) {
            case OrganizerErrc::success:            return "Success";
            case OrganizerErrc::ruleset_not_found:  return "Ruleset not found";
            case OrganizerErrc::ruleset_exists:     return "Ruleset already exists";
            case OrganizerErrc::invalid_ruleset:    return "Ruleset needs a name";
            case OrganizerErrc::corrupted_archive:  return "Archive is corrupted";
            case OrganizerErrc::move_failed:        return "Could not move file";
            case OrganizerErrc::store_unreadable:   return "Ruleset file could not be read";
            case OrganizerErrc::store_unwritable:   return "Ruleset file could not be written";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::OrganizerErrcCategory& organizer_errc_category() noexcept {
    static detail::OrganizerErrcCategory category;
    return category;
}

inline std::error_code make_error_code(OrganizerErrc e) noexcept {
    return {static_cast<int>(e), organizer_errc_category()};
}

struct Ruleset {
    std::string name;
    bool extract{false};
    std::string move;           // Target directory, empty keeps the file in place
    std::string rename;         // Template, "{name}" is the original stem
};

void to_json(nlohmann::json& j, const Ruleset& ruleset);
void from_json(const nlohmann::json& j, Ruleset& ruleset);

// Rulesets persisted as {"rulesets":[...]}. A missing file is seeded with
// defaults on first access.
class RulesetStore {
public:
    explicit RulesetStore(std::filesystem::path path);

    [[nodiscard]] std::expected<std::vector<Ruleset>, std::error_code> list() const;
    [[nodiscard]] std::expected<Ruleset, std::error_code> get(std::string_view name) const;

    [[nodiscard]] std::error_code add(const Ruleset& ruleset);
    [[nodiscard]] std::error_code update(std::string_view name, const Ruleset& ruleset);
    [[nodiscard]] std::error_code remove(std::string_view name);

    [[nodiscard]] static std::vector<Ruleset> defaults();

private:
    [[nodiscard]] std::expected<std::vector<Ruleset>, std::error_code> load_locked() const;
    [[nodiscard]] std::error_code save_locked(const std::vector<Ruleset>& rulesets) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

// "{name}.z64" applied to "Game (USA).zip" gives "Game (USA).z64". Without an
// extension in the template the original one is kept.
[[nodiscard]] std::string format_file_name(std::string_view pattern, std::string_view file_name);

// Unpack the regular-file members of a zip archive under destination and
// return their paths in archive order. Unreadable, truncated or non-zip input
// and members naming a path outside destination give corrupted_archive.
[[nodiscard]] std::expected<std::vector<std::filesystem::path>, std::error_code>
extract_zip(const std::filesystem::path& archive_path, const std::filesystem::path& destination);

class RulesetOrganizer final : public Organizer {
public:
    explicit RulesetOrganizer(RulesetStore& store);

    [[nodiscard]] OrganizeResult apply(const std::string& ruleset, const std::string& file_path) override;

    // Apply one ruleset to several files, one result per file
    [[nodiscard]] std::vector<OrganizeResult> apply_all(const std::string& ruleset,
                                                        const std::vector<std::string>& file_paths);

private:
    RulesetStore& store_;
};

} // namespace roomdl::organizer

namespace std {

template<>
struct is_error_code_enum<roomdl::organizer::OrganizerErrc> : true_type {};

} // namespace std
