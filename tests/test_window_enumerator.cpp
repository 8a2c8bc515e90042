#include <catch2/catch.hpp>

#include "mock_window_system.h"
#include "window_enumerator.h"

TEST_CASE("window list excludes host-owned windows", "[enumerator]")
{
    MockWindowSource source;
    source.windows = {make_window(0x100, "Host"),
                      make_window(0x200, "Editor"),
                      make_window(0x300, "About Tab Host")};
    WindowEnumerator enumerator(source);
    enumerator.setHostWindow(0x100);
    enumerator.addExcludedWindow(0x300);

    auto windows = enumerator.list();
    REQUIRE(windows.size() == 1);
    REQUIRE(windows[0].id == 0x200);

    SECTION("removing an exclusion brings the window back")
    {
        enumerator.removeExcludedWindow(0x300);
        REQUIRE(enumerator.list().size() == 2);
        REQUIRE(enumerator.isExcluded(0x100));
        REQUIRE_FALSE(enumerator.isExcluded(0x300));
    }
}

TEST_CASE("windows without a usable title are skipped", "[enumerator]")
{
    MockWindowSource source;
    source.windows = {make_window(0x10, ""),
                      make_window(0x11, "   \t"),
                      make_window(None, "No id"),
                      make_window(0x12, "Terminal")};
    WindowEnumerator enumerator(source);

    auto windows = enumerator.list();
    REQUIRE(windows.size() == 1);
    REQUIRE(windows[0].title == "Terminal");
}

TEST_CASE("window list is sorted by title, then id", "[enumerator]")
{
    MockWindowSource source;
    source.windows = {make_window(0x30, "xterm"),
                      make_window(0x20, "Calculator"),
                      make_window(0x40, "xterm"),
                      make_window(0x10, "xterm")};
    WindowEnumerator enumerator(source);

    auto windows = enumerator.list();
    REQUIRE(windows.size() == 4);
    REQUIRE(windows[0].title == "Calculator");
    REQUIRE(windows[1].id == 0x10);
    REQUIRE(windows[2].id == 0x30);
    REQUIRE(windows[3].id == 0x40);
}

TEST_CASE("a failed query returns the last good list", "[enumerator]")
{
    MockWindowSource source;
    WindowEnumerator enumerator(source);

    SECTION("before any success the list is empty")
    {
        source.fail = true;
        REQUIRE(enumerator.list().empty());
        REQUIRE(enumerator.lastQueryFailed());
    }

    SECTION("after a success the cache is returned")
    {
        source.windows = {make_window(0x1, "Mail"), make_window(0x2, "Editor")};
        REQUIRE(enumerator.list().size() == 2);

        source.windows.clear();
        source.fail = true;
        auto windows = enumerator.list();
        REQUIRE(windows.size() == 2);
        REQUIRE(windows[0].title == "Editor");
        REQUIRE(enumerator.lastQueryFailed());

        source.fail = false;
        REQUIRE(enumerator.list().empty());
        REQUIRE_FALSE(enumerator.lastQueryFailed());
    }
}

TEST_CASE("titleOf asks the source for a single window", "[enumerator]")
{
    MockWindowSource source;
    source.windows = {make_window(0x5, "Old title")};
    WindowEnumerator enumerator(source);

    source.setTitle(0x5, "New title");
    REQUIRE(enumerator.titleOf(0x5) == "New title");
    REQUIRE(enumerator.titleOf(0x6).empty());
    REQUIRE(enumerator.titleOf(None).empty());
}
