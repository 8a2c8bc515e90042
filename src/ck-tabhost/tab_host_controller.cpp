#include "tab_host_controller.h"

#include <cstdio>

const char *host_state_name(HostState state)
{
    switch (state) {
    case HostState::Idle:
        return "idle";
    case HostState::Refreshing:
        return "refreshing";
    case HostState::Embedding:
        return "embedding";
    case HostState::Releasing:
        return "releasing";
    }
    return "unknown";
}

TabHostController::TabHostController(WindowEnumerator &enumerator, TabManager &tabs)
    : enumerator_(enumerator),
      tabs_(tabs)
{
}

RefreshResult TabHostController::refresh()
{
    RefreshResult result;
    if (state_ != HostState::Idle) {
        fprintf(stderr, "[ck-tabhost] refresh skipped while %s\n", host_state_name(state_));
        result.skipped = true;
        return result;
    }
    StateScope scope(state_, HostState::Refreshing);

    pruneVanishedTabs(&result);
    refreshTabTitles(&result);
    result.menu_changed = menu_.update(enumerator_.list());
    return result;
}

void TabHostController::pruneVanishedTabs(RefreshResult *result)
{
    WindowReparenter *reparenter = tabs_.reparenter();
    if (!reparenter) return;
    std::vector<CapturedTab *> vanished;
    for (const auto &entry : tabs_.tabs()) {
        if (entry->embedded && !reparenter->isAlive(entry->descriptor.id)) {
            vanished.push_back(entry.get());
        }
    }
    for (CapturedTab *tab : vanished) {
        fprintf(stderr, "[ck-tabhost] window 0x%lx '%s' went away, dropping its tab\n",
                (unsigned long)tab->descriptor.id, tab->descriptor.title.c_str());
        if (tab->page) result->vanished_pages.push_back(tab->page);
        tabs_.forgetTab(tab);
    }
}

void TabHostController::refreshTabTitles(RefreshResult *result)
{
    for (const auto &entry : tabs_.tabs()) {
        if (!entry->embedded) continue;
        std::string title = enumerator_.titleOf(entry->descriptor.id);
        if (!WindowEnumerator::hasUsableTitle(WindowDescriptor{entry->descriptor.id, title})) continue;
        if (title == entry->descriptor.title) continue;
        entry->descriptor.title = title;
        result->retitled.push_back(entry.get());
    }
}

CapturedTab *TabHostController::embed(const WindowDescriptor &descriptor, bool *created)
{
    if (created) *created = false;
    if (state_ != HostState::Idle) return nullptr;
    if (descriptor.id == None || enumerator_.isExcluded(descriptor.id)) {
        fprintf(stderr, "[ck-tabhost] refusing to capture host window 0x%lx\n",
                (unsigned long)descriptor.id);
        return nullptr;
    }
    StateScope scope(state_, HostState::Embedding);
    return tabs_.embedWindow(descriptor, created);
}

CapturedTab *TabHostController::selectWindow(int index, bool *created)
{
    if (created) *created = false;
    const WindowDescriptor *entry = menu_.entryAt(index);
    if (!entry) return nullptr;
    WindowDescriptor descriptor = *entry;
    return embed(descriptor, created);
}

CapturedTab *TabHostController::selectWindowById(Window window, bool *created)
{
    if (created) *created = false;
    if (window == None) return nullptr;
    WindowDescriptor descriptor;
    descriptor.id = window;
    for (const auto &entry : menu_.entries()) {
        if (entry.id == window) {
            descriptor.title = entry.title;
            break;
        }
    }
    if (descriptor.title.empty()) {
        descriptor.title = enumerator_.titleOf(window);
    }
    if (!WindowEnumerator::hasUsableTitle(descriptor)) {
        char fallback[64];
        snprintf(fallback, sizeof(fallback), "Window 0x%lx", (unsigned long)window);
        descriptor.title = fallback;
    }
    return embed(descriptor, created);
}

CloseResult TabHostController::closeTab(CapturedTab *tab)
{
    CloseResult result;
    if (!tab || !tabs_.containsTab(tab)) return result;
    StateScope scope(state_, HostState::Releasing);
    Widget page = tab->page;
    result.released = tabs_.closeTab(tab, &result.removed);
    if (result.removed) result.removed_page = page;
    return result;
}

int TabHostController::releaseAll(std::vector<Widget> *removed_pages)
{
    StateScope scope(state_, HostState::Releasing);
    std::vector<Widget> pages;
    for (const auto &entry : tabs_.tabs()) {
        if (entry->page) pages.push_back(entry->page);
    }
    int released = tabs_.releaseAll();
    if (removed_pages) {
        for (Widget page : pages) {
            if (!tabs_.findTabForWidget(page)) removed_pages->push_back(page);
        }
    }
    return released;
}
