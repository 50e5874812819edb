#pragma once
/**
 * MessageBus — 最后值覆盖 (last-value-wins) 的发布/订阅总线
 *
 * 训练循环与外部模拟器 (自有时钟) 之间唯一的共享状态:
 *   - publish(topic, value): 覆盖该 topic 的槽位, 永远成功, 无队列
 *   - read(topic)          : 返回最新值; 自构造 (或 clear) 以来从未发布过 → 缺席
 *   - 不同 topic 之间无顺序保证; 未读值可能被下一次发布覆盖
 *
 * 总线本身从不阻塞。等待/超时/关联由上层 TransportBridge 实现。
 *
 * 实现:
 *   - LastValueBus : 进程内实现 (互斥锁保护, 模拟器线程可并发写)
 *   - 发布钩子: 同步 (lockstep) 模拟器用它在发布者线程上立即应答命令
 */

#include <cstdint>
#include <string>
#include <optional>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace mazerl {

enum class BusType : uint8_t {
    INT   = 0,
    FLOAT = 1
};

/** 单个带类型的标量消息 */
struct BusValue {
    BusType type = BusType::INT;
    int64_t i    = 0;
    double  f    = 0.0;

    static BusValue of_int(int64_t v)  { BusValue b; b.type = BusType::INT;   b.i = v; return b; }
    static BusValue of_float(double v) { BusValue b; b.type = BusType::FLOAT; b.f = v; return b; }

    double as_double() const { return type == BusType::INT ? static_cast<double>(i) : f; }
};

/** 模拟器协议 topic 名称 */
namespace topic {
    // agent → simulator
    constexpr const char* ACTION            = "Action";
    constexpr const char* STEP_SEQ          = "step_seq";
    constexpr const char* RESET             = "reset";
    constexpr const char* MODE              = "mode";
    constexpr const char* RESET_CHECKPOINTS = "reset_checkpoints";
    // simulator → agent
    constexpr const char* ACK_SEQ           = "ack_seq";
    constexpr const char* X                 = "X";
    constexpr const char* Y                 = "Y";
    constexpr const char* Z                 = "Z";
    constexpr const char* THETA             = "Theta";
    constexpr const char* COLLISION         = "Collision";
    constexpr const char* CHECKPOINT        = "checkpoint_reached";
    constexpr const char* GOAL              = "GoalReached";
    constexpr const char* TICK              = "tick";
} // namespace topic

class MessageBus {
public:
    virtual ~MessageBus() = default;

    virtual void publish(const std::string& topic, const BusValue& value) = 0;
    virtual std::optional<BusValue> read(const std::string& topic) const = 0;

    void publish_int(const std::string& topic, int64_t v)  { publish(topic, BusValue::of_int(v)); }
    void publish_float(const std::string& topic, double v) { publish(topic, BusValue::of_float(v)); }
};

class LastValueBus : public MessageBus {
public:
    /** 发布后回调 (锁已释放, 回调内可以再次 publish) */
    using PublishHook = std::function<void(const std::string& topic, const BusValue& value)>;

    LastValueBus() = default;
    LastValueBus(const LastValueBus&) = delete;
    LastValueBus& operator=(const LastValueBus&) = delete;

    void publish(const std::string& topic, const BusValue& value) override;
    std::optional<BusValue> read(const std::string& topic) const override;

    /** 清空所有槽位 (所有 topic 回到缺席状态) */
    void clear();

    void set_publish_hook(PublishHook hook);

    size_t   n_topics() const;
    uint64_t publish_count() const;

private:
    mutable std::mutex mu_;
    std::unordered_map<std::string, BusValue> slots_;
    uint64_t publish_count_ = 0;
    PublishHook hook_;
};

} // namespace mazerl
