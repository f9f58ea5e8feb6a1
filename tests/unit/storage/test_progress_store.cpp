/**
 * @file test_progress_store.cpp
 * @brief Unit tests for the JSON storage file and the profile store on top of it
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <keepsake/storage/progress_store.h>
#include "support/temp_dir.h"

using namespace keepsake;
using namespace keepsake::storage;
using keepsake::test::TempDir;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

TEST_CASE("Storage basic operations", "[storage]") {
    TempDir dir;
    auto file = dir.path() / "data.json";

    SECTION("missing file loads as empty") {
        Storage s(file);
        REQUIRE(s.error().empty());
        REQUIRE_FALSE(s.has("anything"));
        REQUIRE_FALSE(s.dirty());
    }

    SECTION("put marks dirty and save persists") {
        {
            Storage s(file);
            s.put("name", "value");
            REQUIRE(s.dirty());
            REQUIRE(s.save());
            REQUIRE_FALSE(s.dirty());
        }
        Storage again(file);
        REQUIRE(again.has("name"));
        REQUIRE(*again.find("name") == "value");
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "data.json.tmp"));
    }

    SECTION("dirty storage saves on destruction") {
        {
            Storage s(file);
            s.put("auto", 1);
        }
        Storage again(file);
        REQUIRE(again.has("auto"));
    }

    SECTION("remove and clear") {
        Storage s(file);
        s.put("a", 1);
        s.put("b", 2);
        REQUIRE(s.remove("a"));
        REQUIRE_FALSE(s.remove("a"));
        s.clear();
        REQUIRE_FALSE(s.has("b"));
    }

    SECTION("corrupt file loads as empty with an error") {
        auto bad = dir.write("bad.json", "{ definitely not json");
        Storage s(bad);
        REQUIRE_FALSE(s.error().empty());
        REQUIRE_FALSE(s.has("x"));
    }

    SECTION("non-object top level is rejected") {
        auto arr = dir.write("array.json", "[1, 2, 3]");
        Storage s(arr);
        REQUIRE_FALSE(s.error().empty());
    }
}

TEST_CASE("JsonProgressStore round trip", "[storage][progress]") {
    TempDir dir;
    auto file = dir.path() / "profile.json";

    ProgressRecord record;
    record.discoveredIds = {"moon", "star"};
    record.muted = true;
    record.volume = 0.4f;
    record.assignedPhrases = {{"moon", "m"}, {"star", "s"}};
    record.unlockedOrder = {"star", "moon"};
    record.seenFinal = true;

    {
        JsonProgressStore store(file);
        REQUIRE(store.save(record));
        REQUIRE(store.key() == PROFILE_KEY);
    }

    JsonProgressStore store(file);
    ProgressRecord loaded = store.load();
    REQUIRE(loaded.discoveredIds == record.discoveredIds);
    REQUIRE(loaded.muted);
    REQUIRE_THAT(loaded.volume, WithinAbs(0.4f, 1e-6f));
    REQUIRE(loaded.assignedPhrases == record.assignedPhrases);
    REQUIRE(loaded.unlockedOrder == record.unlockedOrder);
    REQUIRE(loaded.seenFinal);
}

TEST_CASE("JsonProgressStore tolerates bad data", "[storage][progress]") {
    SECTION("non-object yields defaults") {
        ProgressRecord r = JsonProgressStore::fromJson(json::array());
        REQUIRE(r.discoveredIds.empty());
        REQUIRE(r.volume == 1.0f);
        REQUIRE_FALSE(r.muted);
    }

    SECTION("each field falls back on its own") {
        json j = {
            {"discoveredIds", {"star", 7, "star", nullptr, ""}},
            {"muted", "yes"},
            {"volume", 4.5},
            {"assignedPhrases", {{"star", "kept"}, {"moon", 12}, {"seal", ""}}},
            {"unlockedOrder", "star"},
            {"seenFinal", true},
        };
        ProgressRecord r = JsonProgressStore::fromJson(j);
        REQUIRE(r.discoveredIds == std::vector<std::string>{"star", "7"});
        REQUIRE_FALSE(r.muted);
        REQUIRE(r.volume == 1.0f);
        REQUIRE(r.assignedPhrases.size() == 1);
        REQUIRE(r.assignedPhrases.at("star") == "kept");
        REQUIRE(r.unlockedOrder.empty());
        REQUIRE(r.seenFinal);
    }

    SECTION("negative volume is clamped to zero") {
        ProgressRecord r = JsonProgressStore::fromJson({{"volume", -2}});
        REQUIRE(r.volume == 0.0f);
    }
}

TEST_CASE("JsonProgressStore load falls back to a fresh profile", "[storage][progress]") {
    TempDir dir;

    SECTION("missing file") {
        JsonProgressStore store(dir.path() / "none.json");
        ProgressRecord r = store.load();
        REQUIRE(r.discoveredIds.empty());
    }

    SECTION("corrupt file") {
        JsonProgressStore store(dir.write("bad.json", "{{{{"));
        ProgressRecord r = store.load();
        REQUIRE(r.discoveredIds.empty());
    }

    SECTION("profile key of the wrong type") {
        JsonProgressStore store(dir.write("wrong.json", R"({"keepsake_profile_v1": [1, 2]})"));
        ProgressRecord r = store.load();
        REQUIRE(r.discoveredIds.empty());
    }

    SECTION("other keys in the file are preserved on save") {
        auto file = dir.write("shared.json", R"({"other": {"x": 1}})");
        {
            JsonProgressStore store(file);
            store.load();
            ProgressRecord r;
            r.discoveredIds = {"moon"};
            REQUIRE(store.save(r));
        }
        Storage raw(file);
        REQUIRE(raw.has("other"));
        REQUIRE(raw.has(PROFILE_KEY));
    }
}
