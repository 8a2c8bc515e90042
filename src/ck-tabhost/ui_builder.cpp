#include "ui_builder.h"

#include <Xm/CascadeBG.h>
#include <Xm/Form.h>
#include <Xm/Frame.h>
#include <Xm/LabelG.h>
#include <Xm/PushBG.h>
#include <Xm/RowColumn.h>
#include <Xm/SeparatoG.h>

extern void on_refresh_windows(Widget, XtPointer, XtPointer);
extern void on_close_tab(Widget, XtPointer, XtPointer);
extern void on_detach_tab(Widget, XtPointer, XtPointer);
extern void on_release_all(Widget, XtPointer, XtPointer);
extern void on_menu_exit(Widget, XtPointer, XtPointer);
extern void on_help_about(Widget, XtPointer, XtPointer);
extern char *xm_name(const char *name);

namespace {
XmString make_string_internal(const char *text)
{
    return XmStringCreateLocalized((String)(text ? text : ""));
}

Widget create_status_segment(Widget parent, const char *name, const char *text, Widget *out_label)
{
    Widget frame = XmCreateFrame(parent, (String)name, NULL, 0);
    XtVaSetValues(frame,
                  XmNshadowType, XmSHADOW_IN,
                  XmNmarginWidth, 4,
                  XmNmarginHeight, 2,
                  NULL);
    XtManageChild(frame);

    XmString xm_text = make_string_internal(text);
    Widget label = XtVaCreateManagedWidget(
        "statusLabel",
        xmLabelGadgetClass, frame,
        XmNlabelString, xm_text,
        XmNalignment, XmALIGNMENT_BEGINNING,
        XmNmarginLeft, 4,
        XmNmarginRight, 4,
        NULL);
    XmStringFree(xm_text);
    if (out_label) {
        *out_label = label;
    }
    return frame;
}
} // namespace

namespace UiBuilder {

XmString make_string(const char *text)
{
    return make_string_internal(text);
}

Widget create_menu_item(Widget parent, const char *name, const char *label)
{
    if (!parent) return NULL;
    XmString xm_label = make_string(label);
    Widget item = XtVaCreateManagedWidget(name,
                                          xmPushButtonGadgetClass,
                                          parent,
                                          XmNlabelString, xm_label,
                                          NULL);
    XmStringFree(xm_label);
    return item;
}

Widget create_cascade_menu(Widget menu_bar, const char *label, const char *name, char mnemonic)
{
    XmString xm_label = make_string(label);
    Widget menu = XmCreatePulldownMenu(menu_bar, const_cast<String>(name), NULL, 0);
    XtVaCreateManagedWidget(
        name,
        xmCascadeButtonGadgetClass,
        menu_bar,
        XmNlabelString, xm_label,
        XmNmnemonic, mnemonic,
        XmNsubMenuId, menu,
        NULL);
    XmStringFree(xm_label);
    return menu;
}

void set_menu_accelerator(Widget menu_item, const char *accel, const char *accel_text)
{
    if (!menu_item || (!accel && !accel_text)) return;
    XmString accel_label = accel_text ? make_string(accel_text) : XmStringCreateLocalized(const_cast<String>(accel));
    XtVaSetValues(menu_item, XmNaccelerator, const_cast<char *>(accel), XmNacceleratorText, accel_label, NULL);
    XmStringFree(accel_label);
}

void set_label_text(Widget label, const char *text)
{
    if (!label) return;
    XmString xm_text = make_string(text);
    XtVaSetValues(label, XmNlabelString, xm_text, NULL);
    XmStringFree(xm_text);
}

Widget createMenuBar(Widget parent, MenuHandles *handles_out)
{
    Widget menu_bar = XmCreateMenuBar(parent, xm_name("tabhostMenuBar"), NULL, 0);
    XtVaSetValues(menu_bar,
                  XmNtopAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  NULL);
    XtManageChild(menu_bar);

    Widget file_menu = create_cascade_menu(menu_bar, "File", "fileMenu", 'F');
    Widget file_refresh = create_menu_item(file_menu, "fileRefresh", "Refresh Windows");
    Widget file_close_tab = create_menu_item(file_menu, "fileCloseTab", "Close Tab");
    Widget file_detach_tab = create_menu_item(file_menu, "fileDetachTab", "Detach Tab");
    Widget file_release_all = create_menu_item(file_menu, "fileReleaseAll", "Release All");
    XtVaCreateManagedWidget("fileSep", xmSeparatorGadgetClass, file_menu, NULL);
    Widget file_exit = create_menu_item(file_menu, "fileExit", "Exit");

    // Items are added and removed at runtime as windows come and go.
    Widget windows_menu = create_cascade_menu(menu_bar, "Windows", "windowsMenu", 'W');

    Widget help_menu = XmCreatePulldownMenu(menu_bar, xm_name("helpMenu"), NULL, 0);
    XmString help_label = make_string("Help");
    Widget help_cascade = XtVaCreateManagedWidget(
        "helpCascade",
        xmCascadeButtonGadgetClass,
        menu_bar,
        XmNlabelString, help_label,
        XmNmnemonic, 'H',
        XmNsubMenuId, help_menu,
        NULL);
    XmStringFree(help_label);
    XtVaSetValues(menu_bar, XmNmenuHelpWidget, help_cascade, NULL);
    Widget help_about = create_menu_item(help_menu, "helpAbout", "About");

    set_menu_accelerator(file_refresh, "<Key>F5", "F5");
    set_menu_accelerator(file_close_tab, "Ctrl<Key>W", "Ctrl+W");
    set_menu_accelerator(file_detach_tab, "Ctrl<Key>D", "Ctrl+D");
    set_menu_accelerator(file_exit, "Alt<Key>F4", "Alt+F4");

    XtVaSetValues(file_refresh, XmNmnemonic, 'R', NULL);
    XtVaSetValues(file_close_tab, XmNmnemonic, 'C', NULL);
    XtVaSetValues(file_detach_tab, XmNmnemonic, 'D', NULL);
    XtVaSetValues(file_release_all, XmNmnemonic, 'A', NULL);
    XtVaSetValues(file_exit, XmNmnemonic, 'X', NULL);

    XtAddCallback(file_refresh, XmNactivateCallback, on_refresh_windows, NULL);
    XtAddCallback(file_close_tab, XmNactivateCallback, on_close_tab, NULL);
    XtAddCallback(file_detach_tab, XmNactivateCallback, on_detach_tab, NULL);
    XtAddCallback(file_release_all, XmNactivateCallback, on_release_all, NULL);
    XtAddCallback(file_exit, XmNactivateCallback, on_menu_exit, NULL);
    XtAddCallback(help_about, XmNactivateCallback, on_help_about, NULL);

    if (handles_out) {
        handles_out->windows_menu = windows_menu;
        handles_out->close_tab_item = file_close_tab;
        handles_out->detach_tab_item = file_detach_tab;
        handles_out->release_all_item = file_release_all;
    }
    return menu_bar;
}

Widget createStatusBar(Widget parent, StatusBarHandles *handles_out)
{
    Widget status_form = XmCreateForm(parent, xm_name("tabhostStatusBar"), NULL, 0);
    XtVaSetValues(status_form,
                  XmNfractionBase, 100,
                  XmNbottomAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNbottomOffset, 6,
                  XmNleftOffset, 10,
                  XmNrightOffset, 10,
                  NULL);
    XtManageChild(status_form);

    Widget status_left = create_status_segment(status_form, "statusMain", "",
                                               handles_out ? &handles_out->message_label : NULL);
    Widget status_right = create_status_segment(status_form, "statusCount", "0 captured",
                                                handles_out ? &handles_out->count_label : NULL);

    XtVaSetValues(status_left,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_POSITION,
                  XmNrightPosition, 80,
                  XmNtopAttachment, XmATTACH_FORM,
                  XmNbottomAttachment, XmATTACH_FORM,
                  NULL);
    XtVaSetValues(status_right,
                  XmNleftAttachment, XmATTACH_POSITION,
                  XmNleftPosition, 80,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNtopAttachment, XmATTACH_FORM,
                  XmNbottomAttachment, XmATTACH_FORM,
                  XmNleftOffset, 6,
                  NULL);

    return status_form;
}

} // namespace UiBuilder
