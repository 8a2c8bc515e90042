#include <Xm/Xm.h>
#include <Xm/DrawingA.h>
#include <Xm/Form.h>
#include <Xm/LabelG.h>
#include <Xm/Protocols.h>
#include <Xm/PushBG.h>
#include <Xm/RowColumn.h>
#include <Xm/SeparatoG.h>
#include <Xm/TabBox.h>
#include <Xm/TabStack.h>
#include <X11/Intrinsic.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <Dt/Dt.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stdarg.h>
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include "../shared/about_dialog.h"
#include "../shared/session_utils.h"
}

#include "tab_host_config.h"
#include "tab_host_controller.h"
#include "tab_label.h"
#include "tab_manager.h"
#include "ui_builder.h"
#include "window_enumerator.h"
#include "x11_window_reparenter.h"
#include "x11_window_source.h"
#include "x_error_trap.h"

static void log_function_entry(const char *func, const char *fmt, ...)
{
    if (!func || !fmt) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "[ck-tabhost] %s(): ", func);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    va_end(args);
}

#define LOG_ENTER(fmt, ...) log_function_entry(__func__, fmt, ##__VA_ARGS__)

static const size_t kTabLabelMaxChars = 32;
static const size_t kMenuLabelMaxChars = 60;

static XtAppContext g_app = NULL;
static Widget g_toplevel = NULL;
static Widget g_tab_stack = NULL;
static Widget g_tab_box = NULL;
static Widget g_tab_header_menu = NULL;
static CapturedTab *g_tab_header_menu_target = NULL;
static Widget g_about_shell = NULL;
static UiBuilder::MenuHandles g_menu;
static UiBuilder::StatusBarHandles g_status;
static std::vector<Widget> g_windows_menu_items;
static XtIntervalId g_refresh_timer = 0;
static bool g_shutting_down = false;
static bool g_refresh_warning_shown = false;
static TabHostConfig g_config;
static SessionData *g_session_data = NULL;
static std::string g_exec_path;
static std::vector<Window> g_startup_captures;

static std::unique_ptr<X11WindowSource> g_window_source;
static std::unique_ptr<X11WindowReparenter> g_reparenter;
static std::unique_ptr<WindowEnumerator> g_enumerator;
static std::unique_ptr<TabHostController> g_controller;

static void run_refresh(const char *reason);
static void rebuild_windows_menu();
static void update_capture_count();
static void update_menu_sensitivity();
static void shutdown_host(const char *reason);
void on_refresh_windows(Widget w, XtPointer client_data, XtPointer call_data);

char *xm_name(const char *name)
{
    return const_cast<char *>(name);
}

static void set_status_message(const char *fmt, ...)
{
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "[ck-tabhost] status: %s\n", buf);
    UiBuilder::set_label_text(g_status.message_label, buf);
}

static TabManager &tab_manager()
{
    return TabManager::instance();
}

static void update_capture_count()
{
    char buf[64];
    snprintf(buf, sizeof(buf), "%d captured", tab_manager().tabCount());
    UiBuilder::set_label_text(g_status.count_label, buf);
}

static void update_menu_sensitivity()
{
    bool has_current = tab_manager().currentTab() != NULL;
    bool has_tabs = tab_manager().tabCount() > 0;
    if (g_menu.close_tab_item) XtSetSensitive(g_menu.close_tab_item, has_current ? True : False);
    if (g_menu.detach_tab_item) XtSetSensitive(g_menu.detach_tab_item, has_current ? True : False);
    if (g_menu.release_all_item) XtSetSensitive(g_menu.release_all_item, has_tabs ? True : False);
}

static void update_tab_label(CapturedTab *tab)
{
    if (!tab || !tab->page) return;
    std::string label = ellipsize_title(tab->descriptor.title, kTabLabelMaxChars);
    XmString xm_label = UiBuilder::make_string(label.c_str());
    XtVaSetValues(tab->page, XmNtabLabelString, xm_label, NULL);
    XmStringFree(xm_label);
}

static void fit_tab_to_container(CapturedTab *tab, const char *reason)
{
    if (!tab || !tab->embedded || !tab->container || !g_reparenter) return;
    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(tab->container, XmNwidth, &width, XmNheight, &height, NULL);
    if (width == 0 || height == 0) return;
    if ((int)width == tab->last_width && (int)height == tab->last_height) return;
    if (g_reparenter->fit(tab->descriptor.id, (int)width, (int)height)) {
        tab->last_width = (int)width;
        tab->last_height = (int)height;
        fprintf(stderr, "[ck-tabhost] fit 0x%lx to %dx%d (%s)\n",
                (unsigned long)tab->descriptor.id, (int)width, (int)height,
                reason ? reason : "unknown");
    }
}

static void focus_embedded_window(CapturedTab *tab)
{
    if (!tab || !tab->embedded || !g_toplevel) return;
    if (!tab->container || !XtIsRealized(tab->container)) return;
    Display *display = XtDisplay(g_toplevel);
    XErrorTrap trap(display, "focus");
    XSetInputFocus(display, tab->descriptor.id, RevertToParent, CurrentTime);
    (void)trap.sync();
}

static void show_status_for_tab(CapturedTab *tab)
{
    if (!tab) {
        set_status_message("%s", tab_manager().tabCount() > 0 ? "" : "Pick a window from the Windows menu.");
        return;
    }
    if (!tab->embedded) {
        set_status_message("%s", tab->error_text.c_str());
        return;
    }
    set_status_message("%s (0x%lx)", tab->descriptor.title.c_str(), (unsigned long)tab->descriptor.id);
}

static void show_capture_error(CapturedTab *tab)
{
    if (!tab || !tab->page || tab->error_label) return;
    if (tab->container) XtUnmanageChild(tab->container);
    XmString text = UiBuilder::make_string(tab->error_text.c_str());
    tab->error_label = XtVaCreateManagedWidget("captureError",
                                               xmLabelGadgetClass, tab->page,
                                               XmNlabelString, text,
                                               XmNalignment, XmALIGNMENT_CENTER,
                                               XmNtopAttachment, XmATTACH_FORM,
                                               XmNbottomAttachment, XmATTACH_FORM,
                                               XmNleftAttachment, XmATTACH_FORM,
                                               XmNrightAttachment, XmATTACH_FORM,
                                               NULL);
    XmStringFree(text);
}

static void on_container_resize(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)client_data;
    (void)call_data;
    CapturedTab *tab = tab_manager().findTabForWidget(w);
    fit_tab_to_container(tab, "container resize");
}

static Window create_tab_page(CapturedTab *tab)
{
    if (!tab || !g_tab_stack) return None;
    Widget page = XmCreateForm(g_tab_stack, xm_name("capturedPage"), NULL, 0);
    XtVaSetValues(page,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  NULL);
    Widget container = XtVaCreateManagedWidget("captureArea",
                                               xmDrawingAreaWidgetClass, page,
                                               XmNmarginWidth, 0,
                                               XmNmarginHeight, 0,
                                               XmNresizePolicy, XmRESIZE_NONE,
                                               XmNtraversalOn, False,
                                               XmNtopAttachment, XmATTACH_FORM,
                                               XmNbottomAttachment, XmATTACH_FORM,
                                               XmNleftAttachment, XmATTACH_FORM,
                                               XmNrightAttachment, XmATTACH_FORM,
                                               NULL);
    XtAddCallback(container, XmNresizeCallback, on_container_resize, NULL);
    tab->page = page;
    tab->container = container;
    update_tab_label(tab);
    XtManageChild(page);

    if (!XtIsRealized(container)) {
        fprintf(stderr, "[ck-tabhost] container for 0x%lx is not realized\n",
                (unsigned long)tab->descriptor.id);
        return None;
    }
    return XtWindow(container);
}

static void select_tab_page(CapturedTab *tab, CapturedTab *previous)
{
    (void)previous;
    if (!tab || !tab->page) {
        update_menu_sensitivity();
        return;
    }
    XmTabStackSelectTab(tab->page, False);
    show_status_for_tab(tab);
    focus_embedded_window(tab);
    update_menu_sensitivity();
}

static void on_tab_selection_changed(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    if (!g_tab_stack) return;
    Widget selected = XmTabStackGetSelectedTab(g_tab_stack);
    CapturedTab *tab = tab_manager().findTabForWidget(selected);
    tab_manager().setCurrentTab(tab);
    fit_tab_to_container(tab, "tab selected");
    show_status_for_tab(tab);
    focus_embedded_window(tab);
    update_menu_sensitivity();
}

static Widget pick_adjacent_tab_page(Widget page)
{
    const auto &tabs = tab_manager().tabs();
    for (size_t i = 0; i < tabs.size(); ++i) {
        if (tabs[i]->page != page) continue;
        if (i + 1 < tabs.size()) return tabs[i + 1]->page;
        if (i > 0) return tabs[i - 1]->page;
        return NULL;
    }
    return NULL;
}

// Destroys the page of a tab that is already gone from the registry and
// moves the selection to a remaining tab if the current one was dropped.
static void destroy_orphaned_page(Widget page)
{
    if (!page) return;
    XtDestroyWidget(page);
    if (tab_manager().currentTab() || tab_manager().tabCount() == 0) return;
    CapturedTab *next_tab = tab_manager().tabs().back().get();
    if (next_tab->page) XmTabStackSelectTab(next_tab->page, False);
    tab_manager().setCurrentTab(next_tab);
}

static CapturedTab *current_or_selected_tab()
{
    CapturedTab *tab = tab_manager().currentTab();
    if (tab) return tab;
    if (!g_tab_stack) return NULL;
    return tab_manager().findTabForWidget(XmTabStackGetSelectedTab(g_tab_stack));
}

static void close_captured_tab(CapturedTab *tab, bool detach)
{
    if (!tab || !g_controller || !tab_manager().containsTab(tab)) return;
    Widget page = tab->page;
    Window window = tab->descriptor.id;
    std::string title = tab->descriptor.title;
    bool was_embedded = tab->embedded;
    LOG_ENTER("window=0x%lx detach=%d embedded=%d", (unsigned long)window, detach ? 1 : 0,
              was_embedded ? 1 : 0);

    // Pick the neighbour while the record is still in the list.
    Widget next_page = pick_adjacent_tab_page(page);
    CloseResult result = g_controller->closeTab(tab);
    if (!result.removed) {
        set_status_message("Could not restore '%s'; it stays in its tab.", title.c_str());
        update_capture_count();
        return;
    }
    if (result.removed_page) XtDestroyWidget(result.removed_page);
    if (next_page) {
        XmTabStackSelectTab(next_page, False);
        CapturedTab *next_tab = tab_manager().findTabForWidget(next_page);
        tab_manager().setCurrentTab(next_tab);
        focus_embedded_window(next_tab);
    }

    if (!was_embedded) {
        set_status_message("Closed tab '%s'.", title.c_str());
    } else if (!result.released) {
        set_status_message("Could not restore '%s' to the desktop.", title.c_str());
    } else if (detach) {
        if (g_reparenter) (void)g_reparenter->activate(window);
        set_status_message("Detached '%s'.", title.c_str());
    } else {
        set_status_message("Released '%s'.", title.c_str());
    }
    update_capture_count();
    update_menu_sensitivity();

    if (g_config.close_when_empty && tab_manager().tabCount() == 0) {
        shutdown_host("last tab closed");
    }
}

static void embed_result(CapturedTab *tab, bool created, const char *fallback_title)
{
    if (!tab) {
        set_status_message("'%s' is no longer available.", fallback_title ? fallback_title : "Window");
        return;
    }
    if (!created) {
        set_status_message("'%s' is already captured.", tab->descriptor.title.c_str());
        return;
    }
    if (!tab->embedded) {
        show_capture_error(tab);
        set_status_message("Could not capture '%s'.", tab->descriptor.title.c_str());
    } else {
        fit_tab_to_container(tab, "captured");
        focus_embedded_window(tab);
        set_status_message("Captured '%s'.", tab->descriptor.title.c_str());
    }
    update_capture_count();
    update_menu_sensitivity();
}

static void on_window_menu_activate(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    if (!g_controller) return;
    int index = (int)(intptr_t)client_data;
    const WindowDescriptor *entry = g_controller->menu().entryAt(index);
    std::string title = entry ? entry->title : std::string();
    bool created = false;
    CapturedTab *tab = g_controller->selectWindow(index, &created);
    embed_result(tab, created, title.c_str());
}

static void rebuild_windows_menu()
{
    if (!g_menu.windows_menu || !g_controller) return;
    for (Widget item : g_windows_menu_items) {
        XtDestroyWidget(item);
    }
    g_windows_menu_items.clear();

    const auto &entries = g_controller->menu().entries();
    if (entries.empty()) {
        Widget empty = UiBuilder::create_menu_item(g_menu.windows_menu, "windowsEmpty", "(no windows)");
        XtSetSensitive(empty, False);
        g_windows_menu_items.push_back(empty);
    }
    for (size_t i = 0; i < entries.size(); ++i) {
        std::string label = ellipsize_title(entries[i].title, kMenuLabelMaxChars);
        Widget item = UiBuilder::create_menu_item(g_menu.windows_menu, "windowItem", label.c_str());
        XtAddCallback(item, XmNactivateCallback, on_window_menu_activate, (XtPointer)(intptr_t)i);
        g_windows_menu_items.push_back(item);
    }

    g_windows_menu_items.push_back(
        XtVaCreateManagedWidget("windowsSep", xmSeparatorGadgetClass, g_menu.windows_menu, NULL));
    Widget refresh = UiBuilder::create_menu_item(g_menu.windows_menu, "windowsRefresh", "Refresh Now");
    XtAddCallback(refresh, XmNactivateCallback, on_refresh_windows, NULL);
    g_windows_menu_items.push_back(refresh);
    fprintf(stderr, "[ck-tabhost] windows menu rebuilt with %zu entries\n", entries.size());
}

static void run_refresh(const char *reason)
{
    if (!g_controller || g_shutting_down) return;
    RefreshResult result = g_controller->refresh();
    if (result.skipped) return;

    for (Widget page : result.vanished_pages) {
        destroy_orphaned_page(page);
    }
    if (!result.vanished_pages.empty()) {
        set_status_message("%zu captured window(s) closed.", result.vanished_pages.size());
        update_capture_count();
        update_menu_sensitivity();
    }
    for (CapturedTab *tab : result.retitled) {
        update_tab_label(tab);
        if (tab == tab_manager().currentTab()) show_status_for_tab(tab);
    }
    if (result.menu_changed) {
        fprintf(stderr, "[ck-tabhost] window set changed (%s)\n", reason ? reason : "unknown");
        rebuild_windows_menu();
    }

    bool failed = g_enumerator && g_enumerator->lastQueryFailed();
    if (failed && !g_refresh_warning_shown) {
        set_status_message("The window list is unavailable; showing the last known windows.");
    }
    g_refresh_warning_shown = failed;
}

static void refresh_timer_cb(XtPointer client_data, XtIntervalId *id)
{
    (void)client_data;
    (void)id;
    g_refresh_timer = 0;
    run_refresh("timer");
    if (!g_shutting_down && g_app) {
        g_refresh_timer = XtAppAddTimeOut(g_app, (unsigned long)g_config.refresh_interval_ms,
                                          refresh_timer_cb, NULL);
    }
}

static CapturedTab *tab_at_visible_index(int index)
{
    const auto &tabs = tab_manager().tabs();
    if (index < 0 || index >= (int)tabs.size()) return NULL;
    return tabs[(size_t)index].get();
}

static Widget find_tab_stack_tabbox(Widget tab_stack)
{
    if (!tab_stack) return NULL;
    WidgetList children = NULL;
    Cardinal num_children = 0;
    XtVaGetValues(tab_stack, XmNchildren, &children, XmNnumChildren, &num_children, NULL);
    for (Cardinal i = 0; i < num_children; ++i) {
        if (XmIsTabBox(children[i])) return children[i];
    }
    for (Cardinal i = 0; i < num_children; ++i) {
        WidgetList nested = NULL;
        Cardinal nested_count = 0;
        XtVaGetValues(children[i], XmNchildren, &nested, XmNnumChildren, &nested_count, NULL);
        for (Cardinal j = 0; j < nested_count; ++j) {
            if (XmIsTabBox(nested[j])) return nested[j];
        }
    }
    return NULL;
}

static void on_header_close(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    CapturedTab *tab = g_tab_header_menu_target;
    g_tab_header_menu_target = NULL;
    close_captured_tab(tab, false);
}

static void on_header_detach(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    CapturedTab *tab = g_tab_header_menu_target;
    g_tab_header_menu_target = NULL;
    close_captured_tab(tab, true);
}

static void ensure_tab_header_menu()
{
    if (g_tab_header_menu || !g_tab_stack) return;
    g_tab_header_menu = XmCreatePopupMenu(g_tab_stack, xm_name("tabHeaderMenu"), NULL, 0);
    Widget detach = UiBuilder::create_menu_item(g_tab_header_menu, "tabHeaderDetach", "Detach Tab");
    Widget close = UiBuilder::create_menu_item(g_tab_header_menu, "tabHeaderClose", "Close Tab");
    XtAddCallback(detach, XmNactivateCallback, on_header_detach, NULL);
    XtAddCallback(close, XmNactivateCallback, on_header_close, NULL);
}

static void on_tabbox_input(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    (void)w;
    (void)client_data;
    if (!event || event->type != ButtonPress) return;
    XButtonEvent *bev = (XButtonEvent *)event;
    if (bev->button != Button3) return;

    ensure_tab_header_menu();
    if (!g_tab_header_menu) return;
    CapturedTab *tab = NULL;
    Widget tabbox = g_tab_box ? g_tab_box : find_tab_stack_tabbox(g_tab_stack);
    if (tabbox && XtIsRealized(tabbox)) {
        int tx = 0, ty = 0;
        Window child = 0;
        Display *dpy = XtDisplay(tabbox);
        if (XTranslateCoordinates(dpy, RootWindow(dpy, DefaultScreen(dpy)), XtWindow(tabbox),
                                  bev->x_root, bev->y_root, &tx, &ty, &child)) {
            tab = tab_at_visible_index(XmTabBoxXYToIndex(tabbox, tx, ty));
        }
    }
    g_tab_header_menu_target = tab ? tab : current_or_selected_tab();
    if (!g_tab_header_menu_target) return;
    if (continue_to_dispatch) *continue_to_dispatch = False;
    XmMenuPosition(g_tab_header_menu, bev);
    XtManageChild(g_tab_header_menu);
}

static void on_toplevel_focus(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    (void)w;
    (void)client_data;
    (void)continue_to_dispatch;
    if (!event || event->type != FocusIn) return;
    if (event->xfocus.detail == NotifyInferior || event->xfocus.detail == NotifyPointer) return;
    focus_embedded_window(tab_manager().currentTab());
}

void on_refresh_windows(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    run_refresh("menu");
    if (g_controller) {
        set_status_message("%zu window(s) available.", g_controller->menu().entries().size());
    }
}

void on_close_tab(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    close_captured_tab(current_or_selected_tab(), false);
}

void on_detach_tab(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    close_captured_tab(current_or_selected_tab(), true);
}

void on_release_all(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    if (!g_controller) return;
    int total = 0;
    for (const auto &entry : tab_manager().tabs()) {
        if (entry->embedded) total++;
    }
    int had_tabs = tab_manager().tabCount();
    std::vector<Widget> removed_pages;
    int released = g_controller->releaseAll(&removed_pages);
    for (Widget page : removed_pages) {
        XtDestroyWidget(page);
    }
    if (released == total) {
        set_status_message("Released %d window(s).", released);
    } else {
        set_status_message("Released %d of %d window(s).", released, total);
    }
    update_capture_count();
    update_menu_sensitivity();
    if (g_config.close_when_empty && had_tabs > 0 && tab_manager().tabCount() == 0) {
        shutdown_host("release all");
    }
}

void on_menu_exit(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    shutdown_host("menu exit");
}

static void on_about_destroyed(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)client_data;
    (void)call_data;
    if (w == g_about_shell) {
        if (g_enumerator && XtIsRealized(w)) g_enumerator->removeExcludedWindow(XtWindow(w));
        g_about_shell = NULL;
    }
}

void on_help_about(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    if (g_about_shell) {
        XtPopup(g_about_shell, XtGrabNone);
        if (XtIsRealized(g_about_shell)) XRaiseWindow(XtDisplay(g_about_shell), XtWindow(g_about_shell));
        return;
    }
    Widget shell = NULL;
    Widget notebook = about_dialog_build(g_toplevel, "aboutShell", "About Tab Host", &shell);
    if (!notebook || !shell) return;
    about_add_standard_pages(notebook, 1,
                             "Tab Host",
                             "CK Tab Host",
                             "Collects application windows as tabs in one window.");
    g_about_shell = shell;
    XtAddCallback(shell, XmNdestroyCallback, on_about_destroyed, NULL);
    XtPopup(shell, XtGrabNone);
    // The dialog is ours; keep it out of the Windows menu.
    if (g_enumerator && XtIsRealized(shell)) g_enumerator->addExcludedWindow(XtWindow(shell));
}

static void save_window_size()
{
    if (!g_toplevel) return;
    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(g_toplevel, XmNwidth, &width, XmNheight, &height, NULL);
    if (width == 0 || height == 0) return;
    if (!g_config.saveWindowSize((int)width, (int)height)) {
        fprintf(stderr, "[ck-tabhost] failed to store window size %dx%d\n", (int)width, (int)height);
    }
}

static void shutdown_host(const char *reason)
{
    LOG_ENTER("reason=%s tabs=%d", reason ? reason : "(null)", tab_manager().tabCount());
    if (g_shutting_down) return;
    g_shutting_down = true;
    if (g_refresh_timer) {
        XtRemoveTimeOut(g_refresh_timer);
        g_refresh_timer = 0;
    }
    save_window_size();
    if (g_controller) {
        int total = tab_manager().tabCount();
        int released = g_controller->releaseAll();
        LOG_ENTER("released %d window(s) from %d tab(s)", released, total);
    }
    if (g_toplevel) XSync(XtDisplay(g_toplevel), False);
    if (g_app) XtAppSetExitFlag(g_app);
}

static void wm_delete_cb(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    shutdown_host("wm delete");
}

static void wm_save_yourself_cb(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)client_data;
    (void)call_data;
    fprintf(stderr, "[ck-tabhost] WM_SAVE_YOURSELF\n");
    if (g_session_data && g_toplevel) {
        session_capture_geometry(g_toplevel, g_session_data, "x", "y", "w", "h");
        if (!session_save(g_toplevel, g_session_data, g_exec_path.c_str())) {
            fprintf(stderr, "[ck-tabhost] session state was not saved\n");
        }
    }
}

static bool parse_window_id(const char *text, Window *out)
{
    if (!text || !text[0] || !out) return false;
    char *end = NULL;
    unsigned long value = strtoul(text, &end, 0);
    if (end == text || *end != '\0' || value == 0) return false;
    *out = (Window)value;
    return true;
}

static void parse_capture_args(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-capture") == 0) {
            Window window = None;
            if (i + 1 < argc && parse_window_id(argv[i + 1], &window)) {
                g_startup_captures.push_back(window);
            } else {
                fprintf(stderr, "[ck-tabhost] -capture needs a window id (decimal or 0x hex)\n");
            }
            i++;
            continue;
        }
        fprintf(stderr, "[ck-tabhost] ignoring unknown argument '%s'\n", argv[i]);
    }
}

static void startup_cb(XtPointer client_data, XtIntervalId *id)
{
    (void)client_data;
    (void)id;
    if (g_shutting_down) return;
    if (!XtIsRealized(g_tab_stack)) {
        XtAppAddTimeOut(g_app, 50, startup_cb, NULL);
        return;
    }

    g_tab_box = find_tab_stack_tabbox(g_tab_stack);
    if (g_tab_box) {
        XtInsertEventHandler(g_tab_box, ButtonPressMask, False, on_tabbox_input, NULL, XtListHead);
    }
    XtAddCallback(g_tab_stack, XmNtabSelectedCallback, on_tab_selection_changed, NULL);

    run_refresh("startup");
    if (g_controller->menu().rebuildCount() == 0) rebuild_windows_menu();

    for (Window window : g_startup_captures) {
        bool created = false;
        CapturedTab *tab = g_controller->selectWindowById(window, &created);
        char fallback[64];
        snprintf(fallback, sizeof(fallback), "0x%lx", (unsigned long)window);
        embed_result(tab, created, fallback);
    }
    g_startup_captures.clear();
    if (tab_manager().tabCount() == 0) show_status_for_tab(NULL);

    g_refresh_timer = XtAppAddTimeOut(g_app, (unsigned long)g_config.refresh_interval_ms,
                                      refresh_timer_cb, NULL);
}

int main(int argc, char *argv[])
{
    g_exec_path = argc > 0 && argv[0] ? argv[0] : "ck-tabhost";
    g_config = TabHostConfig::load();

    char *session_id = session_parse_argument(&argc, argv);
    g_session_data = session_data_create(session_id);
    free(session_id);

    XtAppContext app;
    Widget toplevel = XtVaAppInitialize(&app, "CkTabHost", NULL, 0,
                                        &argc, argv, NULL, NULL);
    if (!toplevel) {
        fprintf(stderr, "[ck-tabhost] cannot open display\n");
        session_data_free(g_session_data);
        return 1;
    }
    g_app = app;
    g_toplevel = toplevel;
    parse_capture_args(argc, argv);

    Display *display = XtDisplay(toplevel);
    DtInitialize(display, toplevel, xm_name("CkTabHost"), xm_name("CkTabHost"));
    XtVaSetValues(toplevel,
                  XmNtitle, "Tab Host",
                  XmNiconName, "Tab Host",
                  XmNwidth, (Dimension)g_config.window_width,
                  XmNheight, (Dimension)g_config.window_height,
                  NULL);

    g_window_source = std::make_unique<X11WindowSource>(display);
    g_reparenter = std::make_unique<X11WindowReparenter>(display);
    g_enumerator = std::make_unique<WindowEnumerator>(*g_window_source);
    g_controller = std::make_unique<TabHostController>(*g_enumerator, tab_manager());
    tab_manager().setReparenter(g_reparenter.get());
    tab_manager().set_container_factory([](CapturedTab *tab) -> Window {
        return create_tab_page(tab);
    });
    tab_manager().set_selection_handler([](CapturedTab *tab, CapturedTab *previous) {
        select_tab_page(tab, previous);
    });

    Widget main_form = XmCreateForm(toplevel, xm_name("tabhostMainForm"), NULL, 0);
    XtVaSetValues(main_form,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  XmNfractionBase, 100,
                  NULL);
    XtManageChild(main_form);

    Widget menu_bar = UiBuilder::createMenuBar(main_form, &g_menu);
    Widget status_bar = UiBuilder::createStatusBar(main_form, &g_status);

    Widget tab_stack = XmCreateTabStack(main_form, xm_name("tabhostTabStack"), NULL, 0);
    XtVaSetValues(tab_stack,
                  XmNtopAttachment, XmATTACH_WIDGET,
                  XmNtopWidget, menu_bar,
                  XmNbottomAttachment, XmATTACH_WIDGET,
                  XmNbottomWidget, status_bar,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNleftOffset, 8,
                  XmNrightOffset, 8,
                  XmNtopOffset, 8,
                  XmNbottomOffset, 8,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  NULL);
    XtManageChild(tab_stack);
    g_tab_stack = tab_stack;
    XtInsertEventHandler(tab_stack, ButtonPressMask, False, on_tabbox_input, NULL, XtListHead);
    XtAddEventHandler(toplevel, FocusChangeMask, False, on_toplevel_focus, NULL);

    bool session_loaded = false;
    if (g_session_data && g_session_data->session_id) {
        session_loaded = session_load(toplevel, g_session_data) ? true : false;
        if (session_loaded) {
            fprintf(stderr, "[ck-tabhost] session restored (Dt) id=%s\n", g_session_data->session_id);
        }
    }

    Atom wm_delete = XmInternAtom(display, xm_name("WM_DELETE_WINDOW"), False);
    XmAddWMProtocolCallback(toplevel, wm_delete, wm_delete_cb, (XtPointer)app);
    XmActivateWMProtocol(toplevel, wm_delete);
    XtVaSetValues(toplevel, XmNdeleteResponse, XmDO_NOTHING, NULL);
    Atom wm_save = XmInternAtom(display, xm_name("WM_SAVE_YOURSELF"), False);
    XmAddWMProtocolCallback(toplevel, wm_save, wm_save_yourself_cb, NULL);
    XmActivateWMProtocol(toplevel, wm_save);

    XtRealizeWidget(toplevel);
    if (session_loaded) {
        session_apply_geometry(toplevel, g_session_data, "x", "y", "w", "h");
    }
    g_enumerator->setHostWindow(XtWindow(toplevel));
    update_capture_count();
    update_menu_sensitivity();
    XtAppAddTimeOut(app, 0, startup_cb, NULL);

    XtAppMainLoop(app);

    fprintf(stderr, "[ck-tabhost] main loop finished\n");
    g_controller.reset();
    g_enumerator.reset();
    g_reparenter.reset();
    g_window_source.reset();
    session_data_free(g_session_data);
    g_session_data = NULL;
    return 0;
}
