#ifndef CK_TABHOST_TAB_HOST_CONTROLLER_H
#define CK_TABHOST_TAB_HOST_CONTROLLER_H

#include <X11/Intrinsic.h>

#include <vector>

#include "tab_manager.h"
#include "window_enumerator.h"
#include "window_menu_model.h"

enum class HostState {
    Idle,
    Refreshing,
    Embedding,
    Releasing,
};

const char *host_state_name(HostState state);

struct RefreshResult {
    bool skipped = false;
    bool menu_changed = false;
    // Pages of tabs whose window no longer exists; the records are gone.
    std::vector<Widget> vanished_pages;
    // Tabs whose window title changed since the last refresh.
    std::vector<CapturedTab *> retitled;
};

struct CloseResult {
    bool released = false;
    bool removed = false;
    // Page of the removed tab, NULL while the tab stays.
    Widget removed_page = NULL;
};

class TabHostController {
public:
    TabHostController(WindowEnumerator &enumerator, TabManager &tabs);

    HostState state() const { return state_; }
    const WindowMenuModel &menu() const { return menu_; }
    WindowEnumerator &enumerator() { return enumerator_; }
    TabManager &tabManager() { return tabs_; }

    RefreshResult refresh();

    // Embeds the menu entry at `index`; an already captured window only has
    // its tab focused and `created` comes back false.
    CapturedTab *selectWindow(int index, bool *created);
    CapturedTab *selectWindowById(Window window, bool *created);

    CloseResult closeTab(CapturedTab *tab);
    // Pages of tabs that are gone afterwards land in `removed_pages`.
    int releaseAll(std::vector<Widget> *removed_pages = nullptr);

private:
    class StateScope {
    public:
        StateScope(HostState &state, HostState next) : state_(state), previous_(state)
        {
            state_ = next;
        }
        ~StateScope() { state_ = previous_; }

    private:
        HostState &state_;
        HostState previous_;
    };

    CapturedTab *embed(const WindowDescriptor &descriptor, bool *created);
    void pruneVanishedTabs(RefreshResult *result);
    void refreshTabTitles(RefreshResult *result);

    WindowEnumerator &enumerator_;
    TabManager &tabs_;
    WindowMenuModel menu_;
    HostState state_ = HostState::Idle;
};

#endif // CK_TABHOST_TAB_HOST_CONTROLLER_H
