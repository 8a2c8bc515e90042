#include "window_menu_model.h"

#include <algorithm>

std::vector<std::string> WindowMenuModel::titleSet(const std::vector<WindowDescriptor> &windows)
{
    std::vector<std::string> titles;
    titles.reserve(windows.size());
    for (const auto &window : windows) {
        titles.push_back(window.title);
    }
    std::sort(titles.begin(), titles.end());
    return titles;
}

bool WindowMenuModel::update(const std::vector<WindowDescriptor> &windows)
{
    std::vector<std::string> titles = titleSet(windows);
    entries_ = windows;
    if (initialized_ && titles == titles_) {
        return false;
    }
    initialized_ = true;
    titles_ = std::move(titles);
    rebuild_count_++;
    return true;
}

const WindowDescriptor *WindowMenuModel::entryAt(int index) const
{
    if (index < 0 || index >= (int)entries_.size()) return NULL;
    return &entries_[(size_t)index];
}
