#include <catch2/catch.hpp>

#include "x11_window_reparenter.h"
#include "x11_window_source.h"

namespace {
ClientWindowInfo normal_client()
{
    ClientWindowInfo info;
    info.viewable = true;
    info.wm_state = 1; // NormalState
    info.desktop = 0;
    info.current_desktop = 0;
    return info;
}
} // namespace

TEST_CASE("only visible clients on the current desktop are listed", "[x11]")
{
    ClientWindowInfo info = normal_client();
    REQUIRE(is_visible_client(info));

    SECTION("iconified windows are skipped")
    {
        info.wm_state = 3;
        REQUIRE_FALSE(is_visible_client(info));
    }

    SECTION("withdrawn windows are skipped")
    {
        info.wm_state = 0;
        REQUIRE_FALSE(is_visible_client(info));
    }

    SECTION("hidden windows are skipped")
    {
        info.hidden = true;
        REQUIRE_FALSE(is_visible_client(info));
    }

    SECTION("windows on another desktop are skipped")
    {
        info.desktop = 2;
        REQUIRE_FALSE(is_visible_client(info));
    }

    SECTION("sticky windows show on every desktop")
    {
        info.desktop = 0xFFFFFFFFL;
        info.current_desktop = 3;
        REQUIRE(is_visible_client(info));
    }

    SECTION("missing desktop hints do not hide a window")
    {
        info.desktop = -1;
        info.current_desktop = 1;
        REQUIRE(is_visible_client(info));
        info.desktop = 4;
        info.current_desktop = -1;
        REQUIRE(is_visible_client(info));
    }

    SECTION("unmapped windows are skipped")
    {
        info.viewable = false;
        REQUIRE_FALSE(is_visible_client(info));
    }

    SECTION("override-redirect, dock and desktop windows are skipped")
    {
        ClientWindowInfo popup = info;
        popup.override_redirect = true;
        REQUIRE_FALSE(is_visible_client(popup));
        ClientWindowInfo panel = info;
        panel.dock_or_desktop = true;
        REQUIRE_FALSE(is_visible_client(panel));
    }

    SECTION("a window without WM_STATE still counts")
    {
        info.wm_state = -1;
        REQUIRE(is_visible_client(info));
    }
}

TEST_CASE("a withdrawn window is free once it is back on the root", "[x11]")
{
    const Window root = 0x10;

    REQUIRE(wm_released_window(root, root, -1));
    REQUIRE(wm_released_window(root, root, 0));
    // Still in the window manager's frame.
    REQUIRE_FALSE(wm_released_window(0x4400, root, -1));
    REQUIRE_FALSE(wm_released_window(None, root, -1));
    // Back on the root but the window manager has not cleared WM_STATE yet.
    REQUIRE_FALSE(wm_released_window(root, root, 1));
    REQUIRE_FALSE(wm_released_window(root, root, 3));
}

TEST_CASE("poll_until stops after a bounded number of attempts", "[x11]")
{
    int checks = 0;
    int waits = 0;

    SECTION("a condition that never holds")
    {
        bool done = poll_until([&]() { checks++; return false; }, 5, [&]() { waits++; });
        REQUIRE_FALSE(done);
        REQUIRE(checks == 5);
        REQUIRE(waits == 4);
    }

    SECTION("a condition that holds on the third check")
    {
        bool done = poll_until([&]() { return ++checks == 3; }, 5, [&]() { waits++; });
        REQUIRE(done);
        REQUIRE(checks == 3);
        REQUIRE(waits == 2);
    }

    SECTION("no attempts never succeeds")
    {
        bool done = poll_until([&]() { checks++; return true; }, 0, [&]() { waits++; });
        REQUIRE_FALSE(done);
        REQUIRE(checks == 0);
        REQUIRE(waits == 0);
    }
}
