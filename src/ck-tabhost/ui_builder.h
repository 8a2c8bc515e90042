#ifndef CK_TABHOST_UI_BUILDER_H
#define CK_TABHOST_UI_BUILDER_H

#include <Xm/Xm.h>

namespace UiBuilder {

struct MenuHandles {
    Widget windows_menu = NULL;
    Widget close_tab_item = NULL;
    Widget detach_tab_item = NULL;
    Widget release_all_item = NULL;
};

struct StatusBarHandles {
    Widget message_label = NULL;
    Widget count_label = NULL;
};

XmString make_string(const char *text);

Widget create_menu_item(Widget parent, const char *name, const char *label);
Widget create_cascade_menu(Widget menu_bar, const char *label, const char *name, char mnemonic);
void set_menu_accelerator(Widget menu_item, const char *accel, const char *accel_text);
void set_label_text(Widget label, const char *text);

Widget createMenuBar(Widget parent, MenuHandles *handles_out);
Widget createStatusBar(Widget parent, StatusBarHandles *handles_out);

} // namespace UiBuilder

#endif // CK_TABHOST_UI_BUILDER_H
