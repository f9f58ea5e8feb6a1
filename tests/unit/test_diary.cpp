/**
 * @file test_diary.cpp
 * @brief Unit tests for Diary paging
 */

#include <catch2/catch_test_macros.hpp>
#include <keepsake/diary.h>

using namespace keepsake;

TEST_CASE("Diary empty state", "[diary]") {
    Diary diary;
    DiaryPage page = diary.page();
    REQUIRE(page.total == 0);
    REQUIRE(page.meta() == "Page 0 / 0");
    REQUIRE_FALSE(page.text.empty());
    REQUIRE_FALSE(page.canPrev);
    REQUIRE_FALSE(page.canNext);
    REQUIRE_FALSE(diary.next(0.0));

    diary.setEmptyText("Nothing yet");
    REQUIRE(diary.page().text == "Nothing yet");
}

TEST_CASE("Diary paging", "[diary]") {
    Diary diary;
    diary.setPhrases({"first", "second", "third"});
    diary.open();
    REQUIRE(diary.isOpen());

    DiaryPage page = diary.page();
    REQUIRE(page.text == "first");
    REQUIRE(page.meta() == "Page 1 / 3");
    REQUIRE_FALSE(page.canPrev);
    REQUIRE(page.canNext);

    SECTION("next swaps after the fade-out") {
        REQUIRE(diary.next(0.0));
        REQUIRE(diary.index() == 1);
        REQUIRE(diary.page().swapping);
        REQUIRE(diary.page().text == "first");

        REQUIRE_FALSE(diary.update(Diary::SWAP_MS - 1.0));
        REQUIRE(diary.update(Diary::SWAP_MS));
        REQUIRE(diary.page().text == "second");
        REQUIRE(diary.page().canPrev);
    }

    SECTION("bounds are respected") {
        REQUIRE_FALSE(diary.prev(0.0));
        diary.next(0.0);
        diary.next(10.0);
        REQUIRE_FALSE(diary.next(20.0));
        diary.update(1000.0);
        REQUIRE(diary.page().meta() == "Page 3 / 3");
        REQUIRE_FALSE(diary.page().canNext);
    }

    SECTION("shrinking the list clamps the index") {
        diary.next(0.0);
        diary.next(0.0);
        diary.update(1000.0);
        diary.setPhrases({"only"});
        REQUIRE(diary.index() == 0);
        REQUIRE(diary.page().text == "only");
    }

    SECTION("reopening shows the current page without a swap") {
        diary.next(0.0);
        diary.close();
        diary.open();
        REQUIRE_FALSE(diary.page().swapping);
        REQUIRE(diary.page().text == "second");
    }
}
