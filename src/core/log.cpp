#include "core/log.h"
#include <atomic>
#include <cstring>

namespace mazerl {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= g_log_level.load();
}

bool parse_log_level(const char* name, LogLevel& out) {
    if (!name) return false;
    if (std::strcmp(name, "error") == 0) { out = LogLevel::ERR;   return true; }
    if (std::strcmp(name, "warn")  == 0) { out = LogLevel::WARN;  return true; }
    if (std::strcmp(name, "info")  == 0) { out = LogLevel::INFO;  return true; }
    if (std::strcmp(name, "debug") == 0) { out = LogLevel::DEBUG; return true; }
    return false;
}

} // namespace mazerl
