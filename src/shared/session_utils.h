#ifndef SESSION_UTILS_H
#define SESSION_UTILS_H

#include <Xm/Xm.h>
#include <Dt/Session.h>

/* Key/value pairs written to the CDE session file, one "key=value" per line */
typedef struct SessionKV {
    char *key;
    char *value;
    struct SessionKV *next;
} SessionKV;

typedef struct {
    char *session_id; /* NULL when the app was not started by the session manager */
    SessionKV *items;
} SessionData;

/* Removes "-session <id>" from argv before Xt sees it.
 * Returns a malloc'd copy of the id, or NULL. */
char *session_parse_argument(int *argc, char **argv);

SessionData *session_data_create(const char *session_id);
void session_data_free(SessionData *data);

/* Lookups return NULL / default_value for missing keys; integers must be
 * plain decimal. */
const char *session_data_get(SessionData *data, const char *key);
int session_data_get_int(SessionData *data, const char *key, int default_value);
void session_data_set(SessionData *data, const char *key, const char *value);
void session_data_set_int(SessionData *data, const char *key, int value);

/* Reads the file DtSessionRestorePath names for data->session_id. */
Boolean session_load(Widget toplevel, SessionData *data);

/* Writes the file DtSessionSavePath hands out and registers
 * "exec_path -session <file>" as the restart command. Returns False if
 * nothing could be written. */
Boolean session_save(Widget toplevel, SessionData *data, const char *exec_path);

/* Toplevel position and size under the given keys */
void session_capture_geometry(Widget toplevel, SessionData *data,
                              const char *key_x, const char *key_y,
                              const char *key_w, const char *key_h);
Boolean session_apply_geometry(Widget toplevel, SessionData *data,
                               const char *key_x, const char *key_y,
                               const char *key_w, const char *key_h);

#endif /* SESSION_UTILS_H */
