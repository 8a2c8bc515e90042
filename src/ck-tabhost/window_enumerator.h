#ifndef CK_TABHOST_WINDOW_ENUMERATOR_H
#define CK_TABHOST_WINDOW_ENUMERATOR_H

#include <X11/X.h>

#include <string>
#include <vector>

#include "window_descriptor.h"
#include "window_source.h"

// Produces the list of windows the user can capture: titled, not owned by
// the host, sorted by title. A failed query yields the last good list.
class WindowEnumerator {
public:
    explicit WindowEnumerator(WindowSource &source);

    void setHostWindow(Window window);
    void addExcludedWindow(Window window);
    void removeExcludedWindow(Window window);
    bool isExcluded(Window window) const;

    std::vector<WindowDescriptor> list();
    std::string titleOf(Window window);

    const std::vector<WindowDescriptor> &cached() const { return cache_; }
    bool lastQueryFailed() const { return last_query_failed_; }

    static bool hasUsableTitle(const WindowDescriptor &descriptor);
    static void sortByTitle(std::vector<WindowDescriptor> *windows);

private:
    WindowSource &source_;
    Window host_window_ = None;
    std::vector<Window> excluded_;
    std::vector<WindowDescriptor> cache_;
    bool last_query_failed_ = false;
};

#endif // CK_TABHOST_WINDOW_ENUMERATOR_H
