#include "tab_host_config.h"

#include <algorithm>

extern "C" {
#include "../shared/config_utils.h"
}

TabHostConfig TabHostConfig::load()
{
    TabHostConfig cfg;
    int interval = config_read_int(kFileName, "refresh_interval_ms", cfg.refresh_interval_ms);
    cfg.refresh_interval_ms = std::min(std::max(interval, kMinRefreshIntervalMs), kMaxRefreshIntervalMs);

    int width = config_read_int(kFileName, "window_width", cfg.window_width);
    int height = config_read_int(kFileName, "window_height", cfg.window_height);
    cfg.window_width = std::max(width, kMinWindowSize);
    cfg.window_height = std::max(height, kMinWindowSize);

    cfg.close_when_empty = config_read_int(kFileName, "close_when_empty", 0) != 0;
    return cfg;
}

bool TabHostConfig::saveWindowSize(int width, int height) const
{
    if (width < kMinWindowSize || height < kMinWindowSize) return false;
    if (config_write_int(kFileName, "window_width", width) != 0) return false;
    return config_write_int(kFileName, "window_height", height) == 0;
}
