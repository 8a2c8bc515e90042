#ifndef CK_TABHOST_TAB_LABEL_H
#define CK_TABHOST_TAB_LABEL_H

#include <cstddef>
#include <string>

size_t utf8_codepoints(const std::string &s);
size_t utf8_prefix_bytes(const std::string &s, size_t codepoints);

// Shortens `title` to at most `max_codepoints` characters, ending in "..."
// when anything was cut. Never splits a UTF-8 sequence.
std::string ellipsize_title(const std::string &title, size_t max_codepoints);

#endif // CK_TABHOST_TAB_LABEL_H
