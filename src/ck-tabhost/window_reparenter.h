#ifndef CK_TABHOST_WINDOW_REPARENTER_H
#define CK_TABHOST_WINDOW_REPARENTER_H

#include <X11/X.h>

// Moves foreign top-level windows in and out of host containers. Every call
// is best-effort: failures are logged by the implementation and reported
// as false.
class WindowReparenter {
public:
    virtual ~WindowReparenter() = default;

    // Reparents `window` under `container` and maps it.
    virtual bool capture(Window window, Window container) = 0;

    // Reparents `window` back to the desktop root and maps it.
    virtual bool release(Window window) = 0;

    // Resizes an embedded window to fill its container.
    virtual bool fit(Window window, int width, int height) = 0;

    virtual bool isAlive(Window window) = 0;
};

#endif // CK_TABHOST_WINDOW_REPARENTER_H
