#include <catch2/catch.hpp>

#include "mock_window_system.h"
#include "window_menu_model.h"

TEST_CASE("first update always builds the menu", "[menu]")
{
    WindowMenuModel menu;
    REQUIRE(menu.update({}));
    REQUIRE(menu.rebuildCount() == 1);
    REQUIRE(menu.entries().empty());
}

TEST_CASE("unchanged title set does not rebuild the menu", "[menu]")
{
    WindowMenuModel menu;
    REQUIRE(menu.update({make_window(0x1, "Editor"), make_window(0x2, "Mail")}));

    SECTION("same windows")
    {
        REQUIRE_FALSE(menu.update({make_window(0x1, "Editor"), make_window(0x2, "Mail")}));
        REQUIRE(menu.rebuildCount() == 1);
    }

    SECTION("same titles in another order")
    {
        REQUIRE_FALSE(menu.update({make_window(0x2, "Mail"), make_window(0x1, "Editor")}));
        REQUIRE(menu.rebuildCount() == 1);
    }

    SECTION("same titles with new ids keep the entries current")
    {
        REQUIRE_FALSE(menu.update({make_window(0x7, "Editor"), make_window(0x2, "Mail")}));
        REQUIRE(menu.entryAt(0)->id == 0x7);
    }
}

TEST_CASE("a changed title set rebuilds the menu", "[menu]")
{
    WindowMenuModel menu;
    menu.update({make_window(0x1, "Editor")});

    REQUIRE(menu.update({make_window(0x1, "Editor"), make_window(0x2, "Mail")}));
    REQUIRE(menu.rebuildCount() == 2);
    REQUIRE(menu.update({make_window(0x2, "Mail")}));
    REQUIRE(menu.update({make_window(0x2, "Mail - Inbox")}));
    REQUIRE(menu.rebuildCount() == 4);
}

TEST_CASE("entryAt rejects out-of-range indexes", "[menu]")
{
    WindowMenuModel menu;
    menu.update({make_window(0x1, "Editor")});
    REQUIRE(menu.entryAt(0) != nullptr);
    REQUIRE(menu.entryAt(-1) == nullptr);
    REQUIRE(menu.entryAt(1) == nullptr);
}
