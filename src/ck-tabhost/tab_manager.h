#ifndef CK_TABHOST_TAB_MANAGER_H
#define CK_TABHOST_TAB_MANAGER_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "captured_tab.h"
#include "window_reparenter.h"

class TabManager {
public:
    static TabManager &instance();

    void setReparenter(WindowReparenter *reparenter);
    WindowReparenter *reparenter() const { return reparenter_; }

    // Builds the page and container widgets for a new tab and returns the
    // X window the captured window goes into, or None on failure.
    using ContainerFactory = std::function<Window(CapturedTab *tab)>;
    void set_container_factory(ContainerFactory factory);

    using TabSelectionHandler = std::function<void(CapturedTab *tab, CapturedTab *previous)>;
    void set_selection_handler(TabSelectionHandler handler);

    // Captures `descriptor` into a new tab. If the window is already captured
    // the existing tab is selected instead and `created` is set to false.
    // A tab whose capture failed is still returned, with `embedded` false
    // and `error_text` set.
    CapturedTab *embedWindow(const WindowDescriptor &descriptor, bool *created);

    // Releases the window (if it was embedded) and drops the tab record.
    // When the release fails but the window still exists the tab stays
    // embedded and `removed` comes back false.
    bool closeTab(CapturedTab *tab, bool *removed = nullptr);

    // Drops the tab record without touching the window.
    void forgetTab(CapturedTab *tab);

    // Returns the number of embedded windows given back to the desktop.
    int releaseAll();

    CapturedTab *addTab(std::unique_ptr<CapturedTab> tab);
    CapturedTab *findTabForWindow(Window window) const;
    CapturedTab *findTabForWidget(Widget widget) const;
    bool containsTab(const CapturedTab *tab) const;

    void selectTab(CapturedTab *tab);
    CapturedTab *currentTab() const;
    void setCurrentTab(CapturedTab *tab);

    std::vector<std::unique_ptr<CapturedTab>> &tabs();
    const std::vector<std::unique_ptr<CapturedTab>> &tabs() const;
    int tabCount() const { return (int)tabs_.size(); }

private:
    void removeTab(CapturedTab *tab);

    std::vector<std::unique_ptr<CapturedTab>> tabs_;
    CapturedTab *current_tab_ = nullptr;
    WindowReparenter *reparenter_ = nullptr;
    ContainerFactory container_factory_;
    TabSelectionHandler selection_handler_;
};

#endif // CK_TABHOST_TAB_MANAGER_H
