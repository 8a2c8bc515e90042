#include "x11_window_reparenter.h"

#include <X11/Xutil.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>

#include "x_error_trap.h"

namespace {
// The window manager gets about half a second to unframe a withdrawn client.
const int kWithdrawPollAttempts = 50;
const useconds_t kWithdrawPollIntervalUs = 10000;

const long kWithdrawnState = 0;
} // namespace

bool wm_released_window(Window parent, Window root, long wm_state)
{
    if (parent == None || parent != root) return false;
    return wm_state < 0 || wm_state == kWithdrawnState;
}

X11WindowReparenter::X11WindowReparenter(Display *display)
    : display_(display)
{
}

bool X11WindowReparenter::readRootGeometry(Window window, SavedGeometry *out)
{
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_, window, &attrs)) return false;
    int root_x = attrs.x;
    int root_y = attrs.y;
    Window child = None;
    XTranslateCoordinates(display_, window, attrs.root, 0, 0, &root_x, &root_y, &child);
    out->x = root_x - attrs.border_width;
    out->y = root_y - attrs.border_width;
    out->width = (unsigned int)attrs.width;
    out->height = (unsigned int)attrs.height;
    return true;
}

Window X11WindowReparenter::parentOf(Window window)
{
    Window root_return = None;
    Window parent_return = None;
    Window *children = NULL;
    unsigned int child_count = 0;
    if (!XQueryTree(display_, window, &root_return, &parent_return, &children, &child_count)) {
        return None;
    }
    if (children) XFree(children);
    return parent_return;
}

long X11WindowReparenter::readWmState(Window window)
{
    Atom wm_state = XInternAtom(display_, "WM_STATE", False);
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, wm_state, 0, 2, False, wm_state,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success || !prop) {
        return -1;
    }
    long state = -1;
    if (actual_format == 32 && item_count > 0) {
        state = ((const long *)prop)[0];
    }
    XFree(prop);
    return state;
}

// XWithdrawWindow only asks; the window manager unframes the client from its
// own connection, so wait until the window is back on the root.
bool X11WindowReparenter::waitForWithdrawal(Window window)
{
    Window root = DefaultRootWindow(display_);
    return poll_until([&]() { return wm_released_window(parentOf(window), root, readWmState(window)); },
                      kWithdrawPollAttempts,
                      []() { usleep(kWithdrawPollIntervalUs); });
}

// Puts the window back on the desktop. A window the window manager still
// frames is only remapped; one already in `container` goes back to the root.
void X11WindowReparenter::rollBack(Window window, Window container, const SavedGeometry &geometry)
{
    XErrorTrap trap(display_, "capture rollback");
    if (parentOf(window) == container) {
        XReparentWindow(display_, window, DefaultRootWindow(display_), geometry.x, geometry.y);
    }
    XMapWindow(display_, window);
    if (trap.sync()) {
        XRemoveFromSaveSet(display_, window);
        (void)trap.sync();
    }
}

bool X11WindowReparenter::capture(Window window, Window container)
{
    if (!display_ || window == None || container == None) return false;
    XErrorTrap trap(display_, "capture");

    SavedGeometry geometry;
    if (!readRootGeometry(window, &geometry) || !trap.sync()) {
        fprintf(stderr, "[ck-tabhost] capture: window 0x%lx is gone\n", (unsigned long)window);
        return false;
    }

    // Let the window manager drop its frame before the window moves.
    XWithdrawWindow(display_, window, DefaultScreen(display_));
    XSync(display_, False);
    if (!waitForWithdrawal(window) || !trap.sync()) {
        fprintf(stderr, "[ck-tabhost] capture: window manager kept 0x%lx framed\n",
                (unsigned long)window);
        rollBack(window, container, geometry);
        return false;
    }

    XAddToSaveSet(display_, window);
    XReparentWindow(display_, window, container, 0, 0);
    XMapWindow(display_, window);
    if (!trap.sync() || parentOf(window) != container) {
        fprintf(stderr, "[ck-tabhost] capture: reparent of 0x%lx into 0x%lx failed\n",
                (unsigned long)window, (unsigned long)container);
        rollBack(window, container, geometry);
        return false;
    }
    saved_[window] = geometry;
    fprintf(stderr, "[ck-tabhost] captured 0x%lx into 0x%lx (was %ux%u+%d+%d)\n",
            (unsigned long)window, (unsigned long)container,
            geometry.width, geometry.height, geometry.x, geometry.y);
    return true;
}

bool X11WindowReparenter::release(Window window)
{
    if (!display_ || window == None) return false;
    SavedGeometry geometry;
    auto it = saved_.find(window);
    if (it != saved_.end()) geometry = it->second;

    XErrorTrap trap(display_, "release");
    Window container = parentOf(window);
    XUnmapWindow(display_, window);
    XReparentWindow(display_, window, DefaultRootWindow(display_), geometry.x, geometry.y);
    if (geometry.width > 0 && geometry.height > 0) {
        XResizeWindow(display_, window, geometry.width, geometry.height);
    }
    XMapRaised(display_, window);
    // The window manager may already have framed it again, so only check that
    // it left the container.
    if (!trap.sync() || parentOf(window) == container) {
        // Still inside the container; the save-set entry stays so the server
        // hands the window back to the root if the host goes away.
        fprintf(stderr, "[ck-tabhost] release: window 0x%lx could not be restored\n",
                (unsigned long)window);
        return false;
    }
    XRemoveFromSaveSet(display_, window);
    (void)trap.sync();
    saved_.erase(window);
    fprintf(stderr, "[ck-tabhost] released 0x%lx to desktop at %d,%d\n",
            (unsigned long)window, geometry.x, geometry.y);
    return true;
}

bool X11WindowReparenter::fit(Window window, int width, int height)
{
    if (!display_ || window == None || width <= 0 || height <= 0) return false;
    XErrorTrap trap(display_, "fit");
    XMoveResizeWindow(display_, window, 0, 0, (unsigned int)width, (unsigned int)height);
    return trap.sync();
}

bool X11WindowReparenter::isAlive(Window window)
{
    if (!display_ || window == None) return false;
    XErrorTrap trap(display_, "isAlive");
    XWindowAttributes attrs;
    Status ok = XGetWindowAttributes(display_, window, &attrs);
    return trap.sync() && ok;
}

bool X11WindowReparenter::savedGeometry(Window window, SavedGeometry *out) const
{
    auto it = saved_.find(window);
    if (it == saved_.end()) return false;
    if (out) *out = it->second;
    return true;
}

bool X11WindowReparenter::activate(Window window)
{
    if (!display_ || window == None) return false;
    XErrorTrap trap(display_, "activate");
    Window root = DefaultRootWindow(display_);
    XEvent event;
    memset(&event, 0, sizeof(event));
    event.xclient.type = ClientMessage;
    event.xclient.window = window;
    event.xclient.message_type = XInternAtom(display_, "_NET_ACTIVE_WINDOW", False);
    event.xclient.format = 32;
    event.xclient.data.l[0] = 2; // source indication: pager
    event.xclient.data.l[1] = CurrentTime;
    XSendEvent(display_, root, False,
               SubstructureRedirectMask | SubstructureNotifyMask, &event);
    XRaiseWindow(display_, window);
    return trap.sync();
}
