#ifndef CK_TABHOST_X11_WINDOW_SOURCE_H
#define CK_TABHOST_X11_WINDOW_SOURCE_H

#include <X11/Xlib.h>

#include <string>
#include <vector>

#include "window_source.h"

// What the source knows about one candidate window when deciding whether it
// belongs in the Windows menu.
struct ClientWindowInfo {
    bool override_redirect = false;
    bool viewable = false;
    long wm_state = -1;        // ICCCM WM_STATE, -1 when the property is missing
    bool hidden = false;       // _NET_WM_STATE_HIDDEN
    bool dock_or_desktop = false;
    long desktop = -1;         // _NET_WM_DESKTOP, -1 when missing
    long current_desktop = -1; // root _NET_CURRENT_DESKTOP, -1 when missing
};

// True for a visible, normal top-level client on the current workspace.
bool is_visible_client(const ClientWindowInfo &info);

// Lists client windows through the EWMH _NET_CLIENT_LIST property of the root
// window, falling back to walking the root's children for WM_STATE clients
// when no EWMH window manager is running.
class X11WindowSource : public WindowSource {
public:
    explicit X11WindowSource(Display *display);

    X11WindowSource(const X11WindowSource &) = delete;
    X11WindowSource &operator=(const X11WindowSource &) = delete;

    bool queryWindows(std::vector<WindowDescriptor> *out) override;
    std::string readTitle(Window window) override;

    static std::string readWindowTitle(Display *display, Window window);

private:
    bool readClientList(std::vector<Window> *out);
    bool scanRootChildren(std::vector<Window> *out);
    Window findClientWindow(Window window, int depth);
    bool hasWmState(Window window);
    bool readClientInfo(Window window, long current_desktop, ClientWindowInfo *info);
    long readCardinal(Window window, Atom property);
    long readWmState(Window window);
    bool hasNetWmState(Window window, Atom state);
    bool isSkippedType(Window window);

    Display *display_ = NULL;
    Atom net_client_list_ = None;
    Atom net_wm_window_type_ = None;
    Atom net_wm_window_type_dock_ = None;
    Atom net_wm_window_type_desktop_ = None;
    Atom net_wm_state_ = None;
    Atom net_wm_state_hidden_ = None;
    Atom net_wm_desktop_ = None;
    Atom net_current_desktop_ = None;
    Atom wm_state_ = None;
};

#endif // CK_TABHOST_X11_WINDOW_SOURCE_H
