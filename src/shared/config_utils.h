#ifndef CONFIG_UTILS_H
#define CONFIG_UTILS_H

#include <stddef.h>

/* Build a config file path inside XDG_CONFIG_HOME/ck-core or ~/.config/ck-core */
void config_build_path(char *buf, size_t len, const char *filename);

/* Read an integer value from a simple "key value" config file.
 * Returns default_value if file/key is missing or the value is not a number.
 */
int config_read_int(const char *filename, const char *key, int default_value);

/* Write a single integer key/value pair to the config file, creating
 * the ck-core config directory if needed. Other keys are preserved.
 * Returns 0 on success, -1 on failure.
 */
int config_write_int(const char *filename, const char *key, int value);

#endif /* CONFIG_UTILS_H */
