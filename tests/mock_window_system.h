#ifndef CK_TABHOST_TESTS_MOCK_WINDOW_SYSTEM_H
#define CK_TABHOST_TESTS_MOCK_WINDOW_SYSTEM_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "window_reparenter.h"
#include "window_source.h"

class MockWindowSource : public WindowSource {
public:
    bool queryWindows(std::vector<WindowDescriptor> *out) override
    {
        query_count++;
        if (fail) return false;
        *out = windows;
        return true;
    }

    std::string readTitle(Window window) override
    {
        for (const auto &w : windows) {
            if (w.id == window) return w.title;
        }
        return std::string();
    }

    void setTitle(Window window, const std::string &title)
    {
        for (auto &w : windows) {
            if (w.id == window) w.title = title;
        }
    }

    std::vector<WindowDescriptor> windows;
    bool fail = false;
    int query_count = 0;
};

// Records every call so tests can check ordering against tab removal.
class MockReparenter : public WindowReparenter {
public:
    bool capture(Window window, Window container) override
    {
        calls.push_back("capture");
        if (refuse.count(window)) return false;
        containers[window] = container;
        return true;
    }

    bool release(Window window) override
    {
        calls.push_back("release");
        released.push_back(window);
        containers.erase(window);
        return !fail_release;
    }

    bool fit(Window window, int width, int height) override
    {
        (void)window;
        (void)width;
        (void)height;
        return true;
    }

    bool isAlive(Window window) override
    {
        return dead.count(window) == 0;
    }

    std::vector<std::string> calls;
    std::vector<Window> released;
    std::map<Window, Window> containers;
    std::set<Window> refuse;
    std::set<Window> dead;
    bool fail_release = false;
};

inline WindowDescriptor make_window(Window id, const char *title)
{
    WindowDescriptor d;
    d.id = id;
    d.title = title;
    return d;
}

#endif // CK_TABHOST_TESTS_MOCK_WINDOW_SYSTEM_H
