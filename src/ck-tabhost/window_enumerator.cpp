#include "window_enumerator.h"

#include <algorithm>
#include <cctype>
#include <cstdio>

WindowEnumerator::WindowEnumerator(WindowSource &source)
    : source_(source)
{
}

void WindowEnumerator::setHostWindow(Window window)
{
    host_window_ = window;
}

void WindowEnumerator::addExcludedWindow(Window window)
{
    if (window == None || isExcluded(window)) return;
    excluded_.push_back(window);
}

void WindowEnumerator::removeExcludedWindow(Window window)
{
    excluded_.erase(std::remove(excluded_.begin(), excluded_.end(), window), excluded_.end());
}

bool WindowEnumerator::isExcluded(Window window) const
{
    if (window == None) return false;
    if (window == host_window_) return true;
    return std::find(excluded_.begin(), excluded_.end(), window) != excluded_.end();
}

bool WindowEnumerator::hasUsableTitle(const WindowDescriptor &descriptor)
{
    for (char c : descriptor.title) {
        if (!std::isspace((unsigned char)c)) return true;
    }
    return false;
}

void WindowEnumerator::sortByTitle(std::vector<WindowDescriptor> *windows)
{
    if (!windows) return;
    std::sort(windows->begin(), windows->end(),
              [](const WindowDescriptor &a, const WindowDescriptor &b) {
                  if (a.title != b.title) return a.title < b.title;
                  return a.id < b.id;
              });
}

std::vector<WindowDescriptor> WindowEnumerator::list()
{
    std::vector<WindowDescriptor> raw;
    if (!source_.queryWindows(&raw)) {
        if (!last_query_failed_) {
            fprintf(stderr, "[ck-tabhost] window enumeration failed, keeping %zu cached entries\n",
                    cache_.size());
        }
        last_query_failed_ = true;
        return cache_;
    }
    last_query_failed_ = false;

    std::vector<WindowDescriptor> windows;
    windows.reserve(raw.size());
    for (const auto &descriptor : raw) {
        if (descriptor.id == None) continue;
        if (isExcluded(descriptor.id)) continue;
        if (!hasUsableTitle(descriptor)) continue;
        windows.push_back(descriptor);
    }
    sortByTitle(&windows);
    cache_ = windows;
    return windows;
}

std::string WindowEnumerator::titleOf(Window window)
{
    if (window == None) return std::string();
    return source_.readTitle(window);
}
