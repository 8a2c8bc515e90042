#ifndef CK_TABHOST_X_ERROR_TRAP_H
#define CK_TABHOST_X_ERROR_TRAP_H

#include <X11/Xlib.h>

// Installs an Xlib error handler for its lifetime and records the first
// error raised while it is active. Traps nest; the innermost one wins.
class XErrorTrap {
public:
    XErrorTrap(Display *display, const char *context);
    ~XErrorTrap();

    XErrorTrap(const XErrorTrap &) = delete;
    XErrorTrap &operator=(const XErrorTrap &) = delete;

    // Flushes pending requests and returns true if no error was recorded.
    bool sync();

    bool failed() const { return error_code_ != Success; }
    int errorCode() const { return error_code_; }

private:
    static int handleError(Display *display, XErrorEvent *event);

    Display *display_ = NULL;
    const char *context_ = NULL;
    int error_code_ = Success;
    XErrorHandler previous_handler_ = NULL;
    XErrorTrap *previous_trap_ = NULL;
};

#endif // CK_TABHOST_X_ERROR_TRAP_H
