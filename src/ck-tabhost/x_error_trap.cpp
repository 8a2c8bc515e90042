#include "x_error_trap.h"

#include <cstdio>

namespace {
XErrorTrap *g_active_trap = NULL;
}

XErrorTrap::XErrorTrap(Display *display, const char *context)
    : display_(display),
      context_(context ? context : "x11")
{
    if (display_) {
        XSync(display_, False);
    }
    previous_trap_ = g_active_trap;
    g_active_trap = this;
    previous_handler_ = XSetErrorHandler(&XErrorTrap::handleError);
}

XErrorTrap::~XErrorTrap()
{
    if (display_) {
        XSync(display_, False);
    }
    XSetErrorHandler(previous_handler_);
    g_active_trap = previous_trap_;
}

bool XErrorTrap::sync()
{
    if (display_) {
        XSync(display_, False);
    }
    return !failed();
}

int XErrorTrap::handleError(Display *display, XErrorEvent *event)
{
    XErrorTrap *trap = g_active_trap;
    if (!trap || !event) return 0;
    char error_text[256];
    XGetErrorText(display, event->error_code, error_text, sizeof(error_text));
    fprintf(stderr, "[ck-tabhost] X error in %s: %s (request=%d resource=0x%lx)\n",
            trap->context_,
            error_text,
            (int)event->request_code,
            (unsigned long)event->resourceid);
    if (trap->error_code_ == Success) {
        trap->error_code_ = event->error_code;
    }
    return 0;
}
