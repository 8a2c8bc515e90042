#ifndef CK_TABHOST_TAB_HOST_CONFIG_H
#define CK_TABHOST_TAB_HOST_CONFIG_H

struct TabHostConfig {
    static constexpr const char *kFileName = "ck-tabhost.conf";
    static constexpr int kMinRefreshIntervalMs = 250;
    static constexpr int kMaxRefreshIntervalMs = 60000;
    static constexpr int kMinWindowSize = 200;

    int refresh_interval_ms = 2000;
    int window_width = 1024;
    int window_height = 720;
    bool close_when_empty = false;

    // Reads ck-tabhost.conf from the CK-Core config directory. Missing keys
    // keep their defaults, out-of-range values are clamped.
    static TabHostConfig load();

    bool saveWindowSize(int width, int height) const;
};

#endif // CK_TABHOST_TAB_HOST_CONFIG_H
