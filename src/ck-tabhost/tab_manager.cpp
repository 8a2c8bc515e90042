#include "tab_manager.h"

#include <algorithm>
#include <cstdio>

TabManager &TabManager::instance()
{
    static TabManager manager;
    return manager;
}

void TabManager::setReparenter(WindowReparenter *reparenter)
{
    reparenter_ = reparenter;
}

void TabManager::set_container_factory(ContainerFactory factory)
{
    container_factory_ = std::move(factory);
}

void TabManager::set_selection_handler(TabSelectionHandler handler)
{
    selection_handler_ = std::move(handler);
}

CapturedTab *TabManager::embedWindow(const WindowDescriptor &descriptor, bool *created)
{
    if (created) *created = false;
    if (descriptor.id == None) return nullptr;

    CapturedTab *existing = findTabForWindow(descriptor.id);
    if (existing) {
        fprintf(stderr, "[ck-tabhost] window 0x%lx already captured, focusing its tab\n",
                (unsigned long)descriptor.id);
        selectTab(existing);
        return existing;
    }

    auto tab = std::make_unique<CapturedTab>();
    tab->descriptor = descriptor;
    CapturedTab *tab_ptr = addTab(std::move(tab));

    Window container = container_factory_ ? container_factory_(tab_ptr) : None;
    tab_ptr->container_window = container;
    if (container == None) {
        tab_ptr->error_text = "No container window is available for this tab.";
    } else if (!reparenter_) {
        tab_ptr->error_text = "No window system backend is available.";
    } else if (!reparenter_->capture(descriptor.id, container)) {
        tab_ptr->error_text = "The window could not be captured. It may have closed "
                              "or refused to be reparented.";
    } else {
        tab_ptr->embedded = true;
    }
    if (!tab_ptr->embedded) {
        fprintf(stderr, "[ck-tabhost] capture of 0x%lx '%s' failed: %s\n",
                (unsigned long)descriptor.id,
                descriptor.title.c_str(),
                tab_ptr->error_text.c_str());
    }

    if (created) *created = true;
    selectTab(tab_ptr);
    return tab_ptr;
}

bool TabManager::closeTab(CapturedTab *tab, bool *removed)
{
    if (removed) *removed = false;
    if (!containsTab(tab)) return false;
    bool released = true;
    if (tab->embedded) {
        Window window = tab->descriptor.id;
        released = reparenter_ ? reparenter_->release(window) : false;
        if (!released && reparenter_ && reparenter_->isAlive(window)) {
            fprintf(stderr, "[ck-tabhost] keeping tab of 0x%lx, release failed\n",
                    (unsigned long)window);
            return false;
        }
        tab->embedded = false;
    }
    removeTab(tab);
    if (removed) *removed = true;
    return released;
}

void TabManager::forgetTab(CapturedTab *tab)
{
    if (!containsTab(tab)) return;
    removeTab(tab);
}

int TabManager::releaseAll()
{
    std::vector<CapturedTab *> snapshot;
    for (auto it = tabs_.rbegin(); it != tabs_.rend(); ++it) {
        snapshot.push_back(it->get());
    }
    int released = 0;
    for (CapturedTab *tab : snapshot) {
        bool was_embedded = tab->embedded;
        if (closeTab(tab) && was_embedded) {
            released++;
        }
    }
    return released;
}

CapturedTab *TabManager::addTab(std::unique_ptr<CapturedTab> tab)
{
    if (!tab) return nullptr;
    CapturedTab *ptr = tab.get();
    tabs_.push_back(std::move(tab));
    return ptr;
}

CapturedTab *TabManager::findTabForWindow(Window window) const
{
    if (window == None) return nullptr;
    for (const auto &entry : tabs_) {
        if (entry->descriptor.id == window) return entry.get();
    }
    return nullptr;
}

CapturedTab *TabManager::findTabForWidget(Widget widget) const
{
    if (!widget) return nullptr;
    for (const auto &entry : tabs_) {
        if (entry->page == widget || entry->container == widget) return entry.get();
    }
    return nullptr;
}

bool TabManager::containsTab(const CapturedTab *tab) const
{
    if (!tab) return false;
    for (const auto &entry : tabs_) {
        if (entry.get() == tab) return true;
    }
    return false;
}

void TabManager::selectTab(CapturedTab *tab)
{
    CapturedTab *previous = current_tab_;
    current_tab_ = tab;
    if (selection_handler_) {
        selection_handler_(tab, previous);
    }
}

CapturedTab *TabManager::currentTab() const
{
    return current_tab_;
}

void TabManager::setCurrentTab(CapturedTab *tab)
{
    current_tab_ = tab;
}

std::vector<std::unique_ptr<CapturedTab>> &TabManager::tabs()
{
    return tabs_;
}

const std::vector<std::unique_ptr<CapturedTab>> &TabManager::tabs() const
{
    return tabs_;
}

void TabManager::removeTab(CapturedTab *tab)
{
    auto it = std::find_if(tabs_.begin(), tabs_.end(),
                           [tab](const std::unique_ptr<CapturedTab> &entry) {
                               return entry.get() == tab;
                           });
    if (it == tabs_.end()) return;
    if (current_tab_ == tab) {
        current_tab_ = nullptr;
    }
    tabs_.erase(it);
}
