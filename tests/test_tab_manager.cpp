#include <catch2/catch.hpp>

#include "mock_window_system.h"
#include "tab_manager.h"

namespace {
struct TabManagerFixture {
    TabManagerFixture()
    {
        tabs.setReparenter(&reparenter);
        tabs.set_container_factory([this](CapturedTab *tab) -> Window {
            (void)tab;
            return next_container == None ? None : next_container++;
        });
        tabs.set_selection_handler([this](CapturedTab *tab, CapturedTab *previous) {
            (void)previous;
            selected.push_back(tab);
        });
    }

    MockReparenter reparenter;
    TabManager tabs;
    Window next_container = 0x9000;
    std::vector<CapturedTab *> selected;
};
} // namespace

TEST_CASE_METHOD(TabManagerFixture, "embedding captures into a fresh container", "[tabs]")
{
    bool created = false;
    CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);
    REQUIRE(tab != nullptr);
    REQUIRE(created);
    REQUIRE(tab->embedded);
    REQUIRE(tab->error_text.empty());
    REQUIRE(tab->container_window == 0x9000);
    REQUIRE(reparenter.containers[0x100] == 0x9000);
    REQUIRE(tabs.currentTab() == tab);
    REQUIRE(selected.back() == tab);
}

TEST_CASE_METHOD(TabManagerFixture, "embedding a captured window focuses its tab", "[tabs]")
{
    bool created = false;
    CapturedTab *first = tabs.embedWindow(make_window(0x100, "Editor"), &created);
    tabs.embedWindow(make_window(0x200, "Mail"), &created);
    REQUIRE(tabs.currentTab() != first);

    CapturedTab *again = tabs.embedWindow(make_window(0x100, "Editor"), &created);
    REQUIRE(again == first);
    REQUIRE_FALSE(created);
    REQUIRE(tabs.tabCount() == 2);
    REQUIRE(tabs.currentTab() == first);
    REQUIRE(selected.back() == first);
    REQUIRE(reparenter.calls.size() == 2);
}

TEST_CASE_METHOD(TabManagerFixture, "closing a tab releases before removing it", "[tabs]")
{
    bool created = false;
    CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);

    bool present_during_release = false;
    struct OrderCheck : MockReparenter {
        TabManager *tabs = nullptr;
        Window window = None;
        bool *present = nullptr;
        bool release(Window w) override
        {
            *present = tabs->findTabForWindow(window) != nullptr;
            return MockReparenter::release(w);
        }
    } checker;
    checker.tabs = &tabs;
    checker.window = 0x100;
    checker.present = &present_during_release;
    tabs.setReparenter(&checker);

    REQUIRE(tabs.closeTab(tab));
    REQUIRE(present_during_release);
    REQUIRE(checker.released == std::vector<Window>{0x100});
    REQUIRE(tabs.tabCount() == 0);
    REQUIRE(tabs.currentTab() == nullptr);
}

TEST_CASE_METHOD(TabManagerFixture, "a failed release keeps the tab of a live window", "[tabs]")
{
    bool created = false;
    CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);
    reparenter.fail_release = true;
    bool removed = true;

    SECTION("the window still exists")
    {
        REQUIRE_FALSE(tabs.closeTab(tab, &removed));
        REQUIRE_FALSE(removed);
        REQUIRE(tabs.tabCount() == 1);
        REQUIRE(tab->embedded);
        REQUIRE(reparenter.released.size() == 1);

        reparenter.fail_release = false;
        REQUIRE(tabs.closeTab(tab, &removed));
        REQUIRE(removed);
        REQUIRE(tabs.tabCount() == 0);
    }

    SECTION("the window is gone")
    {
        reparenter.dead.insert(0x100);
        REQUIRE_FALSE(tabs.closeTab(tab, &removed));
        REQUIRE(removed);
        REQUIRE(tabs.tabCount() == 0);
    }
}

TEST_CASE_METHOD(TabManagerFixture, "failed captures leave an error tab", "[tabs]")
{
    bool created = false;

    SECTION("the window refuses to be reparented")
    {
        reparenter.refuse.insert(0x100);
        CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Stubborn"), &created);
        REQUIRE(created);
        REQUIRE_FALSE(tab->embedded);
        REQUIRE_FALSE(tab->error_text.empty());
        REQUIRE(tabs.currentTab() == tab);

        REQUIRE(tabs.closeTab(tab));
        REQUIRE(reparenter.released.empty());
        REQUIRE(tabs.tabCount() == 0);
    }

    SECTION("no container could be created")
    {
        next_container = None;
        CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);
        REQUIRE_FALSE(tab->embedded);
        REQUIRE_FALSE(tab->error_text.empty());
        REQUIRE(reparenter.calls.empty());
    }

    SECTION("no backend is installed")
    {
        tabs.setReparenter(nullptr);
        CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);
        REQUIRE_FALSE(tab->embedded);
        REQUIRE_FALSE(tab->error_text.empty());
    }
}

TEST_CASE_METHOD(TabManagerFixture, "releaseAll empties the host", "[tabs]")
{
    bool created = false;
    tabs.embedWindow(make_window(0x100, "Editor"), &created);
    tabs.embedWindow(make_window(0x200, "Mail"), &created);
    reparenter.refuse.insert(0x300);
    tabs.embedWindow(make_window(0x300, "Stubborn"), &created);

    REQUIRE(tabs.releaseAll() == 2);
    REQUIRE(tabs.tabCount() == 0);
    REQUIRE(reparenter.released.size() == 2);
    REQUIRE(reparenter.containers.empty());
}

TEST_CASE_METHOD(TabManagerFixture, "releaseAll counts only embedded windows", "[tabs]")
{
    bool created = false;
    reparenter.refuse.insert(0x100);
    tabs.embedWindow(make_window(0x100, "Stubborn"), &created);
    tabs.embedWindow(make_window(0x200, "Mail"), &created);

    REQUIRE(tabs.releaseAll() == 1);
    REQUIRE(tabs.tabCount() == 0);

    SECTION("an empty host releases nothing")
    {
        REQUIRE(tabs.releaseAll() == 0);
    }
}

TEST_CASE_METHOD(TabManagerFixture, "releaseAll leaves tabs it could not restore", "[tabs]")
{
    bool created = false;
    tabs.embedWindow(make_window(0x100, "Editor"), &created);
    tabs.embedWindow(make_window(0x200, "Mail"), &created);
    reparenter.fail_release = true;

    REQUIRE(tabs.releaseAll() == 0);
    REQUIRE(tabs.tabCount() == 2);
    REQUIRE(reparenter.released.size() == 2);
}

TEST_CASE_METHOD(TabManagerFixture, "tabs can be found by window and widget", "[tabs]")
{
    bool created = false;
    CapturedTab *tab = tabs.embedWindow(make_window(0x100, "Editor"), &created);
    Widget fake_page = reinterpret_cast<Widget>(0x1234);
    tab->page = fake_page;

    REQUIRE(tabs.findTabForWindow(0x100) == tab);
    REQUIRE(tabs.findTabForWindow(0x101) == nullptr);
    REQUIRE(tabs.findTabForWidget(fake_page) == tab);
    REQUIRE(tabs.findTabForWidget(NULL) == nullptr);

    tabs.forgetTab(tab);
    REQUIRE(tabs.tabCount() == 0);
    REQUIRE(reparenter.released.empty());
}
