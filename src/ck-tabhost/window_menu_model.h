#ifndef CK_TABHOST_WINDOW_MENU_MODEL_H
#define CK_TABHOST_WINDOW_MENU_MODEL_H

#include <string>
#include <vector>

#include "window_descriptor.h"

// Backing store of the "Windows" menu. Menu items refer to entries by index,
// so entries are always replaced, while the menu widgets are rebuilt only
// when the set of titles changes.
class WindowMenuModel {
public:
    // Returns true if the menu has to be rebuilt.
    bool update(const std::vector<WindowDescriptor> &windows);

    const std::vector<WindowDescriptor> &entries() const { return entries_; }
    const WindowDescriptor *entryAt(int index) const;
    int rebuildCount() const { return rebuild_count_; }

    static std::vector<std::string> titleSet(const std::vector<WindowDescriptor> &windows);

private:
    std::vector<WindowDescriptor> entries_;
    std::vector<std::string> titles_;
    bool initialized_ = false;
    int rebuild_count_ = 0;
};

#endif // CK_TABHOST_WINDOW_MENU_MODEL_H
