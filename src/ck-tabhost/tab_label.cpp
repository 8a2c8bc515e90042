#include "tab_label.h"

size_t utf8_codepoints(const std::string &s)
{
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = (unsigned char)s[i];
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

size_t utf8_prefix_bytes(const std::string &s, size_t codepoints)
{
    if (codepoints == 0) return 0;
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = (unsigned char)s[i];
        if ((c & 0xC0) != 0x80) {
            seen++;
            if (seen > codepoints) return i;
        }
    }
    return s.size();
}

std::string ellipsize_title(const std::string &title, size_t max_codepoints)
{
    const std::string ellipsis = "...";
    if (utf8_codepoints(title) <= max_codepoints) return title;
    if (max_codepoints <= ellipsis.size()) return ellipsis.substr(0, max_codepoints);
    size_t bytes = utf8_prefix_bytes(title, max_codepoints - ellipsis.size());
    return title.substr(0, bytes) + ellipsis;
}
