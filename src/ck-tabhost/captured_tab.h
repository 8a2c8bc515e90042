#ifndef CK_TABHOST_CAPTURED_TAB_H
#define CK_TABHOST_CAPTURED_TAB_H

#include <X11/Intrinsic.h>

#include <string>

#include "window_descriptor.h"

struct CapturedTab {
    WindowDescriptor descriptor;
    Widget page = NULL;
    Widget container = NULL;
    Widget error_label = NULL;
    Window container_window = None;
    bool embedded = false;
    std::string error_text;
    int last_width = 0;
    int last_height = 0;
};

#endif // CK_TABHOST_CAPTURED_TAB_H
