#ifndef CK_TABHOST_WINDOW_DESCRIPTOR_H
#define CK_TABHOST_WINDOW_DESCRIPTOR_H

#include <X11/X.h>

#include <string>

struct WindowDescriptor {
    Window id = None;
    std::string title;
};

#endif // CK_TABHOST_WINDOW_DESCRIPTOR_H
