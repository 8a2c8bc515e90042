#ifndef CK_TABHOST_WINDOW_SOURCE_H
#define CK_TABHOST_WINDOW_SOURCE_H

#include <string>
#include <vector>

#include "window_descriptor.h"

// Raw list of top-level windows as the window system reports them.
class WindowSource {
public:
    virtual ~WindowSource() = default;

    // Fills `out` with every candidate window; titles may be empty.
    // Returns false if the window system could not be queried at all.
    virtual bool queryWindows(std::vector<WindowDescriptor> *out) = 0;

    // Current title of a single window, empty if unknown.
    virtual std::string readTitle(Window window) = 0;
};

#endif // CK_TABHOST_WINDOW_SOURCE_H
