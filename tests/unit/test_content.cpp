/**
 * @file test_content.cpp
 * @brief Unit tests for the content catalogue and JSON overrides
 */

#include <catch2/catch_test_macros.hpp>
#include <keepsake/content.h>
#include <keepsake/catch_game.h>
#include <keepsake/hold_game.h>
#include <keepsake/sequence_game.h>
#include "support/temp_dir.h"

#include <set>

using namespace keepsake;
using keepsake::test::TempDir;

TEST_CASE("Default content", "[content]") {
    Content c = defaultContent();
    REQUIRE(c.objects.size() == 9);
    REQUIRE(c.phrases.size() == 10);
    REQUIRE(c.finale.size() == 6);
    REQUIRE_FALSE(c.repeatNotice.empty());

    std::set<std::string> ids;
    for (const auto& o : c.objects) ids.insert(o.id);
    REQUIRE(ids.size() == c.objects.size());

    REQUIRE(c.find("moon") != nullptr);
    REQUIRE(c.find("nothing") == nullptr);
    REQUIRE(c.objectIds().front() == "flower");
}

TEST_CASE("Mini-game mapping", "[content]") {
    REQUIRE(miniGameFor("butterfly") == MiniGameKind::Catch);
    REQUIRE(miniGameFor("star") == MiniGameKind::Catch);
    REQUIRE(miniGameFor("letter") == MiniGameKind::Hold);
    REQUIRE(miniGameFor("light") == MiniGameKind::Hold);
    REQUIRE(miniGameFor("moon") == MiniGameKind::Sequence);
    REQUIRE(miniGameFor("anything-else") == MiniGameKind::Sequence);

    REQUIRE(dynamic_cast<CatchGame*>(makeMiniGame(MiniGameKind::Catch, 1).get()) != nullptr);
    REQUIRE(dynamic_cast<HoldGame*>(makeMiniGame(MiniGameKind::Hold, 1).get()) != nullptr);
    REQUIRE(dynamic_cast<SequenceGame*>(makeMiniGame(MiniGameKind::Sequence, 1).get()) != nullptr);
    REQUIRE(std::string(miniGameKindName(MiniGameKind::Hold)) == "hold");
}

TEST_CASE("loadContent overrides", "[content]") {
    TempDir dir;
    Content c = defaultContent();
    std::string error;

    SECTION("partial file keeps the other lists") {
        auto file = dir.write("content.json", R"({
            "phrases": ["a", "b"],
            "repeatNotice": "Again?"
        })");
        REQUIRE(loadContent(file, c, error));
        REQUIRE(c.phrases == std::vector<std::string>{"a", "b"});
        REQUIRE(c.repeatNotice == "Again?");
        REQUIRE(c.objects.size() == 9);
    }

    SECTION("objects replace the catalogue") {
        auto file = dir.write("content.json", R"({
            "objects": [{"id": "kite", "idleSeed": 1.5}, {"id": "shell"}]
        })");
        REQUIRE(loadContent(file, c, error));
        REQUIRE(c.objectIds() == std::vector<std::string>{"kite", "shell"});
        REQUIRE(c.objects[0].idleSeed == 1.5f);
    }

    SECTION("missing file fails") {
        REQUIRE_FALSE(loadContent(dir.path() / "nope.json", c, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("malformed JSON leaves content unchanged") {
        auto file = dir.write("bad.json", "{ not json");
        REQUIRE_FALSE(loadContent(file, c, error));
        REQUIRE(c.phrases.size() == 10);
    }

    SECTION("duplicate ids are rejected") {
        auto file = dir.write("dup.json", R"({"objects": [{"id": "a"}, {"id": "a"}]})");
        REQUIRE_FALSE(loadContent(file, c, error));
        REQUIRE(c.objects.size() == 9);
    }

    SECTION("non-string phrases are rejected") {
        auto file = dir.write("types.json", R"({"phrases": ["ok", 3]})");
        REQUIRE_FALSE(loadContent(file, c, error));
        REQUIRE(c.phrases.size() == 10);
    }
}
