#include "x11_window_source.h"

#include <X11/Xatom.h>
#include <X11/Xutil.h>

#include <cstdio>

#include "x_error_trap.h"

namespace {
const int kMaxClientSearchDepth = 4;

// WM_STATE values from ICCCM 4.1.3.1
const long kWithdrawnState = 0;
const long kIconicState = 3;

// _NET_WM_DESKTOP value of windows shown on every workspace
const long kAllDesktops = 0xFFFFFFFFL;
} // namespace

bool is_visible_client(const ClientWindowInfo &info)
{
    if (info.override_redirect || info.dock_or_desktop) return false;
    if (!info.viewable) return false;
    if (info.wm_state == kWithdrawnState || info.wm_state == kIconicState) return false;
    if (info.hidden) return false;
    if (info.desktop >= 0 && info.current_desktop >= 0 &&
        info.desktop != kAllDesktops && info.desktop != info.current_desktop) {
        return false;
    }
    return true;
}

X11WindowSource::X11WindowSource(Display *display)
    : display_(display)
{
    if (!display_) return;
    net_client_list_ = XInternAtom(display_, "_NET_CLIENT_LIST", False);
    net_wm_window_type_ = XInternAtom(display_, "_NET_WM_WINDOW_TYPE", False);
    net_wm_window_type_dock_ = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DOCK", False);
    net_wm_window_type_desktop_ = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_DESKTOP", False);
    net_wm_state_ = XInternAtom(display_, "_NET_WM_STATE", False);
    net_wm_state_hidden_ = XInternAtom(display_, "_NET_WM_STATE_HIDDEN", False);
    net_wm_desktop_ = XInternAtom(display_, "_NET_WM_DESKTOP", False);
    net_current_desktop_ = XInternAtom(display_, "_NET_CURRENT_DESKTOP", False);
    wm_state_ = XInternAtom(display_, "WM_STATE", False);
}

bool X11WindowSource::queryWindows(std::vector<WindowDescriptor> *out)
{
    if (!out || !display_) return false;
    out->clear();

    std::vector<Window> windows;
    if (!readClientList(&windows) && !scanRootChildren(&windows)) {
        fprintf(stderr, "[ck-tabhost] window query failed: root window unreadable\n");
        return false;
    }

    long current_desktop = readCardinal(DefaultRootWindow(display_), net_current_desktop_);

    // Windows can disappear between the list read and the per-window reads;
    // the trap keeps the resulting BadWindow errors from reaching Xt.
    XErrorTrap trap(display_, "queryWindows");
    for (Window window : windows) {
        if (window == None) continue;
        ClientWindowInfo info;
        if (!readClientInfo(window, current_desktop, &info)) continue;
        if (!is_visible_client(info)) continue;

        WindowDescriptor descriptor;
        descriptor.id = window;
        descriptor.title = readWindowTitle(display_, window);
        out->push_back(descriptor);
    }
    (void)trap.sync();
    return true;
}

std::string X11WindowSource::readTitle(Window window)
{
    XErrorTrap trap(display_, "readTitle");
    std::string title = readWindowTitle(display_, window);
    if (!trap.sync()) return std::string();
    return title;
}

std::string X11WindowSource::readWindowTitle(Display *display, Window window)
{
    if (!display || window == None) return std::string();
    std::string title;

    Atom net_wm_name = XInternAtom(display, "_NET_WM_NAME", False);
    Atom utf8_string = XInternAtom(display, "UTF8_STRING", False);
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display, window, net_wm_name, 0, 1024, False, utf8_string,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) == Success && prop) {
        if (actual_type == utf8_string && actual_format == 8 && item_count > 0) {
            title.assign((const char *)prop, (size_t)item_count);
        }
        XFree(prop);
    }
    if (!title.empty()) return title;

    char *name = NULL;
    if (XFetchName(display, window, &name) && name) {
        title = name;
        XFree(name);
    }
    return title;
}

bool X11WindowSource::readClientList(std::vector<Window> *out)
{
    Window root = DefaultRootWindow(display_);
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, root, net_client_list_, 0, ~0L, False, XA_WINDOW,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success) {
        return false;
    }
    if (!prop) return false;
    bool ok = actual_type == XA_WINDOW && actual_format == 32;
    if (ok) {
        const Window *windows = (const Window *)prop;
        out->assign(windows, windows + item_count);
    }
    XFree(prop);
    return ok;
}

bool X11WindowSource::scanRootChildren(std::vector<Window> *out)
{
    Window root = DefaultRootWindow(display_);
    Window root_return = None;
    Window parent_return = None;
    Window *children = NULL;
    unsigned int child_count = 0;
    if (!XQueryTree(display_, root, &root_return, &parent_return, &children, &child_count)) {
        return false;
    }
    XErrorTrap trap(display_, "scanRootChildren");
    for (unsigned int i = 0; i < child_count; ++i) {
        Window client = findClientWindow(children[i], 0);
        if (client != None) out->push_back(client);
    }
    if (children) XFree(children);
    (void)trap.sync();
    return true;
}

Window X11WindowSource::findClientWindow(Window window, int depth)
{
    if (hasWmState(window)) return window;
    if (depth >= kMaxClientSearchDepth) return None;

    Window root_return = None;
    Window parent_return = None;
    Window *children = NULL;
    unsigned int child_count = 0;
    if (!XQueryTree(display_, window, &root_return, &parent_return, &children, &child_count)) {
        return None;
    }
    Window found = None;
    for (unsigned int i = 0; i < child_count && found == None; ++i) {
        found = findClientWindow(children[i], depth + 1);
    }
    if (children) XFree(children);
    return found;
}

bool X11WindowSource::hasWmState(Window window)
{
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, wm_state_, 0, 0, False, AnyPropertyType,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success) {
        return false;
    }
    if (prop) XFree(prop);
    return actual_type != None;
}

bool X11WindowSource::readClientInfo(Window window, long current_desktop, ClientWindowInfo *info)
{
    XWindowAttributes attrs;
    if (!XGetWindowAttributes(display_, window, &attrs)) return false;
    info->override_redirect = attrs.override_redirect ? true : false;
    info->viewable = attrs.map_state == IsViewable;
    info->wm_state = readWmState(window);
    info->hidden = hasNetWmState(window, net_wm_state_hidden_);
    info->dock_or_desktop = isSkippedType(window);
    info->desktop = readCardinal(window, net_wm_desktop_);
    info->current_desktop = current_desktop;
    return true;
}

long X11WindowSource::readCardinal(Window window, Atom property)
{
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, property, 0, 1, False, XA_CARDINAL,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success || !prop) {
        return -1;
    }
    long value = -1;
    if (actual_format == 32 && item_count > 0) {
        // Format 32 data comes back in longs; keep only the 32 bits on the wire.
        value = (long)(((const unsigned long *)prop)[0] & 0xFFFFFFFFUL);
    }
    XFree(prop);
    return value;
}

long X11WindowSource::readWmState(Window window)
{
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, wm_state_, 0, 2, False, wm_state_,
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

bool X11WindowSource::hasNetWmState(Window window, Atom state)
{
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, net_wm_state_, 0, 32, False, XA_ATOM,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success || !prop) {
        return false;
    }
    bool found = false;
    const Atom *states = (const Atom *)prop;
    for (unsigned long i = 0; i < item_count; ++i) {
        if (states[i] == state) {
            found = true;
            break;
        }
    }
    XFree(prop);
    return found;
}

bool X11WindowSource::isSkippedType(Window window)
{
    Atom actual_type = None;
    int actual_format = 0;
    unsigned long item_count = 0;
    unsigned long bytes_after = 0;
    unsigned char *prop = NULL;
    if (XGetWindowProperty(display_, window, net_wm_window_type_, 0, 32, False, XA_ATOM,
                           &actual_type, &actual_format, &item_count, &bytes_after,
                           &prop) != Success || !prop) {
        return false;
    }
    bool skipped = false;
    const Atom *types = (const Atom *)prop;
    for (unsigned long i = 0; i < item_count; ++i) {
        if (types[i] == net_wm_window_type_dock_ || types[i] == net_wm_window_type_desktop_) {
            skipped = true;
            break;
        }
    }
    XFree(prop);
    return skipped;
}
