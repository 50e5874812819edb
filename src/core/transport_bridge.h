#pragma once
/**
 * TransportBridge — 总线同步层
 *
 * MessageBus 只提供覆盖式 publish/read, 从不阻塞。
 * Environment 通过本层获得:
 *   1. 类型化读取: read_int / read_float / read_flag
 *      类型或范围不符 (NaN, 非整数, flag 非 0/1) → 丢弃 + 日志 + 视为缺席
 *   2. 有界等待: wait_for(pred, timeout) 轮询直到谓词成立或超时
 *   3. 命令关联: 每条命令携带新的序列号, 只有 ack_seq == 该序列号
 *      才认为模拟器已处理该命令 (防止读到上一个动作遗留的旧值)
 *
 * 序列号起点取自总线上已有的 ack_seq,
 * 保证新建的 bridge 不会与模拟器残留的应答值撞号。
 */

#include "core/message_bus.h"
#include <cstdint>
#include <string>
#include <optional>
#include <functional>
#include <unordered_set>

namespace mazerl {

struct BusWaitConfig {
    float step_timeout_ms  = 2000.0f;  // 单步等待模拟器应答上限
    float reset_timeout_ms = 5000.0f;  // reset 应答上限 (物理模拟复位较慢)
    float poll_interval_ms = 1.0f;     // 轮询间隔 (0 = 仅 yield)
};

class TransportBridge {
public:
    explicit TransportBridge(MessageBus& bus, const BusWaitConfig& cfg = {});

    // --- Publish (fire-and-forget) ---
    void publish_int(const std::string& topic, int64_t v)  { bus_.publish_int(topic, v); }
    void publish_float(const std::string& topic, double v) { bus_.publish_float(topic, v); }

    // --- Typed read (malformed → nullopt) ---
    std::optional<int64_t> read_int(const std::string& topic);
    std::optional<double>  read_float(const std::string& topic);
    std::optional<bool>    read_flag(const std::string& topic);

    /** 轮询 pred 直到成立 (true) 或超时 (false). timeout<=0 时只检查一次 */
    bool wait_for(const std::function<bool()>& pred, float timeout_ms) const;

    /** 等待模拟器回显 ack_seq == seq */
    bool wait_for_ack(int64_t seq, float timeout_ms);

    /** 分配下一个命令序列号 (严格递增) */
    int64_t next_sequence() { return ++seq_; }
    int64_t last_sequence() const { return seq_; }

    size_t malformed_count() const { return malformed_; }
    const BusWaitConfig& wait_config() const { return cfg_; }
    MessageBus& bus() { return bus_; }

private:
    MessageBus&   bus_;
    BusWaitConfig cfg_;
    int64_t       seq_       = 0;
    size_t        malformed_ = 0;
    std::unordered_set<std::string> warned_topics_;  // 每个 topic 只警告一次

    void report_malformed(const std::string& topic, const BusValue& v, const char* why);
};

} // namespace mazerl
