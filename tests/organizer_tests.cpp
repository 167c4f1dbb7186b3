// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <roomdl/organizer/ruleset_organizer.hpp>
#include "support/http_fixture.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace roomdl::organizer;
using namespace roomdl::test;

namespace fs = std::filesystem;

namespace {

struct Member {
    std::string name;
    std::string data;
};

// Deflated zip written through libarchive
std::string make_zip(const std::vector<Member>& members) {
    std::string out(1024 * 1024 + 4096 * members.size(), '\0');
    for (const auto& m : members) {
        out.resize(out.size() + m.data.size());
    }
    std::size_t used = 0;

    archive* writer = archive_write_new();
    REQUIRE(archive_write_set_format_zip(writer) == ARCHIVE_OK);
    archive_write_set_bytes_in_last_block(writer, 1);
    REQUIRE(archive_write_open_memory(writer, out.data(), out.size(), &used) == ARCHIVE_OK);
    for (const auto& m : members) {
        archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, m.name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(m.data.size()));
        REQUIRE(archive_write_header(writer, entry) == ARCHIVE_OK);
        REQUIRE(archive_write_data(writer, m.data.data(), m.data.size()) == static_cast<la_ssize_t>(m.data.size()));
        archive_entry_free(entry);
    }
    REQUIRE(archive_write_close(writer) == ARCHIVE_OK);
    archive_write_free(writer);

    out.resize(used);
    return out;
}

std::string make_zip(const std::string& member, const std::string& data) {
    return make_zip({{member, data}});
}

} // namespace

TEST_CASE("format_file_name", "[organizer]") {
    CHECK(format_file_name("{name}.z64", "Super Mario 64 (USA).zip") == "Super Mario 64 (USA).z64");
    CHECK(format_file_name("{name}", "game.gba") == "game.gba");
    CHECK(format_file_name("[{name}] {name}.bin", "x.zip") == "[x] x.bin");
    CHECK(format_file_name("fixed", "x.iso") == "fixed.iso");
}

TEST_CASE("extract_zip", "[organizer]") {
    TempDir dir;
    auto payload = make_payload(64 * 1024);
    auto out = dir / "out";

    SECTION("Members are unpacked in archive order") {
        write_file(dir / "set.zip", make_zip({{"disc1.bin", payload}, {"tracks/disc2.bin", "two"}}));
        auto files = extract_zip(dir / "set.zip", out);
        REQUIRE(files.has_value());
        REQUIRE(files->size() == 2);
        CHECK((*files)[0].filename() == "disc1.bin");
        CHECK((*files)[1].filename() == "disc2.bin");
        CHECK(read_file(out / "disc1.bin") == payload);
        CHECK(read_file(out / "tracks" / "disc2.bin") == "two");
    }

    SECTION("Truncated download") {
        auto zip = make_zip("game.z64", payload);
        write_file(dir / "cut.zip", zip.substr(0, zip.size() / 2));
        auto files = extract_zip(dir / "cut.zip", out);
        REQUIRE_FALSE(files.has_value());
        CHECK(files.error() == OrganizerErrc::corrupted_archive);
    }

    SECTION("Not an archive at all") {
        write_file(dir / "page.zip", "<html>404 not found</html> padding padding");
        auto files = extract_zip(dir / "page.zip", out);
        REQUIRE_FALSE(files.has_value());
        CHECK(files.error() == OrganizerErrc::corrupted_archive);
    }

    SECTION("Members may not leave the destination") {
        write_file(dir / "evil.zip", make_zip("../escaped.bin", "x"));
        auto files = extract_zip(dir / "evil.zip", out);
        REQUIRE_FALSE(files.has_value());
        CHECK(files.error() == OrganizerErrc::corrupted_archive);
        CHECK_FALSE(fs::exists(dir / "escaped.bin"));
    }

    SECTION("Missing file") {
        CHECK_FALSE(extract_zip(dir / "absent.zip", out).has_value());
    }
}

TEST_CASE("RulesetStore - seeded with defaults", "[organizer]") {
    TempDir dir;
    RulesetStore store(dir / "config" / "rulesets.json");

    auto rulesets = store.list();
    REQUIRE(rulesets.has_value());
    REQUIRE(rulesets->size() == 3);
    CHECK((*rulesets)[0].name == "n64");
    CHECK((*rulesets)[0].extract);
    CHECK((*rulesets)[0].rename == "{name}.z64");
    CHECK(fs::exists(dir / "config" / "rulesets.json"));

    auto json = nlohmann::json::parse(read_file(dir / "config" / "rulesets.json"));
    CHECK(json["rulesets"].size() == 3);
}

TEST_CASE("RulesetStore - add, update and remove", "[organizer]") {
    TempDir dir;
    RulesetStore store(dir / "rulesets.json");

    CHECK_FALSE(store.add({"snes", false, "/srv/snes", "{name}.sfc"}));
    CHECK(store.add({"snes", false, "", ""}) == OrganizerErrc::ruleset_exists);
    CHECK(store.add({"", false, "", ""}) == OrganizerErrc::invalid_ruleset);

    auto snes = store.get("snes");
    REQUIRE(snes.has_value());
    CHECK(snes->move == "/srv/snes");

    SECTION("Update keeps the name when none is given") {
        CHECK_FALSE(store.update("snes", {"", true, "/srv/super", "{name}.smc"}));
        auto updated = store.get("snes");
        REQUIRE(updated.has_value());
        CHECK(updated->extract);
        CHECK(updated->rename == "{name}.smc");
    }

    SECTION("Update may not collide with another ruleset") {
        CHECK(store.update("snes", {"n64", false, "", ""}) == OrganizerErrc::ruleset_exists);
        CHECK(store.update("nes", {"nes", false, "", ""}) == OrganizerErrc::ruleset_not_found);
    }

    SECTION("Remove") {
        CHECK_FALSE(store.remove("snes"));
        CHECK(store.get("snes").error() == OrganizerErrc::ruleset_not_found);
        CHECK(store.remove("snes") == OrganizerErrc::ruleset_not_found);
        CHECK(store.list()->size() == 3);
    }
}

TEST_CASE("RulesetStore - unreadable file", "[organizer]") {
    TempDir dir;
    write_file(dir / "rulesets.json", "rulesets: [yaml]");
    RulesetStore store(dir / "rulesets.json");
    auto rulesets = store.list();
    REQUIRE_FALSE(rulesets.has_value());
    CHECK(rulesets.error() == OrganizerErrc::store_unreadable);
}

TEST_CASE("RulesetOrganizer - apply", "[organizer]") {
    TempDir dir;
    RulesetStore store(dir / "rulesets.json");
    auto target = dir / "organized" / "n64";
    REQUIRE_FALSE(store.add({"n64-here", true, target.string(), "{name}.z64"}));
    REQUIRE_FALSE(store.add({"rename-only", false, "", "{name}.bin"}));
    REQUIRE_FALSE(store.add({"move-only", false, (dir / "sorted").string(), ""}));
    RulesetOrganizer organizer(store);

    SECTION("Archive members are extracted, then moved and renamed") {
        auto source = dir / "downloads" / "Mario (USA).zip";
        write_file(source, make_zip("Mario (USA).n64", "rom"));

        auto result = organizer.apply("n64-here", source.string());
        CHECK(result.errors.empty());
        REQUIRE(result.extracted_files.size() == 1);
        CHECK(fs::path(result.extracted_files[0]).parent_path() == dir / "downloads" / "extracted" / "Mario (USA)");
        REQUIRE(result.moved_files.size() == 1);
        CHECK(result.moved_files[0] == (target / "Mario (USA).z64").string());
        CHECK(read_file(target / "Mario (USA).z64") == "rom");
        CHECK(fs::exists(source));
        CHECK_FALSE(fs::exists(dir / "downloads" / "extracted"));
    }

    SECTION("Every member of a multi-file archive is organized") {
        auto source = dir / "downloads" / "Set.zip";
        write_file(source, make_zip({{"a.n64", "a"}, {"sub/b.n64", "b"}}));

        auto result = organizer.apply("n64-here", source.string());
        CHECK(result.errors.empty());
        REQUIRE(result.moved_files.size() == 2);
        CHECK(read_file(target / "a.z64") == "a");
        CHECK(read_file(target / "b.z64") == "b");
    }

    SECTION("Corrupted archive stays where it is") {
        auto source = dir / "downloads" / "broken.zip";
        write_file(source, "not a zip, just some bytes long enough");

        auto result = organizer.apply("n64-here", source.string());
        CHECK(result.moved_files.empty());
        CHECK(result.extracted_files.empty());
        REQUIRE(result.errors.size() == 1);
        CHECK_THAT(result.errors[0], Catch::Matchers::ContainsSubstring("corrupted"));
        CHECK(fs::exists(source));
        CHECK_FALSE(fs::exists(dir / "downloads" / "extracted"));
    }

    SECTION("Archives are left packed when the ruleset does not extract") {
        REQUIRE_FALSE(store.add({"keep-zip", false, (dir / "zips").string(), ""}));
        auto source = dir / "downloads" / "game.zip";
        auto zip = make_zip("game.n64", "rom");
        write_file(source, zip);

        auto result = organizer.apply("keep-zip", source.string());
        CHECK(result.extracted_files.empty());
        REQUIRE(result.moved_files.size() == 1);
        CHECK(read_file(dir / "zips" / "game.zip") == zip);
    }

    SECTION("Rename in place") {
        auto source = dir / "downloads" / "game.iso";
        write_file(source, "iso");
        auto result = organizer.apply("rename-only", source.string());
        REQUIRE(result.moved_files.size() == 1);
        CHECK(result.moved_files[0] == (dir / "downloads" / "game.bin").string());
    }

    SECTION("Move keeps the name") {
        auto source = dir / "downloads" / "game.iso";
        write_file(source, "iso");
        auto result = organizer.apply("move-only", source.string());
        REQUIRE(result.moved_files.size() == 1);
        CHECK(read_file(dir / "sorted" / "game.iso") == "iso");
    }

    SECTION("Unknown ruleset and missing file") {
        auto unknown = organizer.apply("dreamcast", (dir / "x.zip").string());
        CHECK(unknown.moved_files.empty());
        REQUIRE(unknown.errors.size() == 1);
        CHECK_THAT(unknown.errors[0], Catch::Matchers::ContainsSubstring("dreamcast"));

        auto missing = organizer.apply("move-only", (dir / "absent.iso").string());
        CHECK(missing.moved_files.empty());
        CHECK(missing.errors.size() == 1);
    }

    SECTION("apply_all reports per file") {
        write_file(dir / "downloads" / "a.iso", "a");
        auto results = organizer.apply_all("move-only",
            {(dir / "downloads" / "a.iso").string(), (dir / "downloads" / "b.iso").string()});
        REQUIRE(results.size() == 2);
        CHECK(results[0].moved_files.size() == 1);
        CHECK(results[1].errors.size() == 1);
    }
}
