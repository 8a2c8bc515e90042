#ifndef CK_TABHOST_X11_WINDOW_REPARENTER_H
#define CK_TABHOST_X11_WINDOW_REPARENTER_H

#include <X11/Xlib.h>

#include <unordered_map>

#include "window_reparenter.h"

// True once the window manager has given up a withdrawn client: the window
// sits directly on the root and its WM_STATE (-1 when missing) is gone or
// Withdrawn.
bool wm_released_window(Window parent, Window root, long wm_state);

// Calls `done` up to `attempts` times, calling `wait` between two calls.
// Returns true as soon as `done` does.
template <typename Done, typename Wait>
bool poll_until(Done done, int attempts, Wait wait)
{
    for (int i = 0; i < attempts; ++i) {
        if (done()) return true;
        if (i + 1 < attempts) wait();
    }
    return false;
}

struct SavedGeometry {
    int x = 0;
    int y = 0;
    unsigned int width = 0;
    unsigned int height = 0;
};

class X11WindowReparenter : public WindowReparenter {
public:
    explicit X11WindowReparenter(Display *display);

    X11WindowReparenter(const X11WindowReparenter &) = delete;
    X11WindowReparenter &operator=(const X11WindowReparenter &) = delete;

    bool capture(Window window, Window container) override;
    bool release(Window window) override;
    bool fit(Window window, int width, int height) override;
    bool isAlive(Window window) override;

    bool savedGeometry(Window window, SavedGeometry *out) const;

    // Asks the window manager to raise and focus a top-level window.
    bool activate(Window window);

private:
    bool readRootGeometry(Window window, SavedGeometry *out);
    Window parentOf(Window window);
    long readWmState(Window window);
    bool waitForWithdrawal(Window window);
    void rollBack(Window window, Window container, const SavedGeometry &geometry);

    Display *display_ = NULL;
    std::unordered_map<Window, SavedGeometry> saved_;
};

#endif // CK_TABHOST_X11_WINDOW_REPARENTER_H
