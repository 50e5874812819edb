#pragma once
/**
 * 日志 — printf 风格分级控制台输出
 *
 *   ERR/WARN → stderr, INFO/DEBUG → stdout
 *   进程级日志级别 (原子变量, 模拟器线程也会打印)
 *
 * 用法:
 *   MAZERL_LOG_INFO("Episode %u/%u", ep, n);
 *   set_log_level(LogLevel::WARN);   // 测试/基准中静音
 */

#include <cstdio>

namespace mazerl {

enum class LogLevel : int {
    ERR   = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

void     set_log_level(LogLevel level);
LogLevel log_level();
bool     log_enabled(LogLevel level);

/** "error"/"warn"/"info"/"debug" → LogLevel, 未知名称返回 false */
bool parse_log_level(const char* name, LogLevel& out);

} // namespace mazerl

#define MAZERL_LOG_AT(level, stream, tag, ...) do { \
    if (::mazerl::log_enabled(level)) { \
        fprintf(stream, tag); \
        fprintf(stream, __VA_ARGS__); \
        fprintf(stream, "\n"); \
    } \
} while(0)

#define MAZERL_LOG_ERROR(...) MAZERL_LOG_AT(::mazerl::LogLevel::ERR,   stderr, "[ERROR] ", __VA_ARGS__)
#define MAZERL_LOG_WARN(...)  MAZERL_LOG_AT(::mazerl::LogLevel::WARN,  stderr, "[WARN]  ", __VA_ARGS__)
#define MAZERL_LOG_INFO(...)  MAZERL_LOG_AT(::mazerl::LogLevel::INFO,  stdout, "[INFO]  ", __VA_ARGS__)
#define MAZERL_LOG_DEBUG(...) MAZERL_LOG_AT(::mazerl::LogLevel::DEBUG, stdout, "[DEBUG] ", __VA_ARGS__)
