#include "core/transport_bridge.h"
#include "core/log.h"
#include <chrono>
#include <cmath>
#include <thread>

namespace mazerl {

TransportBridge::TransportBridge(MessageBus& bus, const BusWaitConfig& cfg)
    : bus_(bus)
    , cfg_(cfg)
{
    auto ack = read_int(topic::ACK_SEQ);
    if (ack && *ack > 0) seq_ = *ack;
}

void TransportBridge::report_malformed(const std::string& topic, const BusValue& v, const char* why) {
    malformed_++;
    if (warned_topics_.insert(topic).second) {
        MAZERL_LOG_WARN("malformed message on '%s' (%s, value=%g), treated as absent",
                        topic.c_str(), why, v.as_double());
    } else {
        MAZERL_LOG_DEBUG("malformed message on '%s' (%s)", topic.c_str(), why);
    }
}

std::optional<int64_t> TransportBridge::read_int(const std::string& topic) {
    auto v = bus_.read(topic);
    if (!v) return std::nullopt;
    if (v->type == BusType::INT) return v->i;

    // 浮点载荷: 仅接受有限且为整数的值
    if (!std::isfinite(v->f) || std::floor(v->f) != v->f) {
        report_malformed(topic, *v, "expected integer");
        return std::nullopt;
    }
    // [-2^63, 2^63) 之外的值无法表示为 int64
    if (v->f < -9223372036854775808.0 || v->f >= 9223372036854775808.0) {
        report_malformed(topic, *v, "out of range");
        return std::nullopt;
    }
    return static_cast<int64_t>(v->f);
}

std::optional<double> TransportBridge::read_float(const std::string& topic) {
    auto v = bus_.read(topic);
    if (!v) return std::nullopt;
    double d = v->as_double();
    if (!std::isfinite(d)) {
        report_malformed(topic, *v, "non-finite");
        return std::nullopt;
    }
    return d;
}

std::optional<bool> TransportBridge::read_flag(const std::string& topic) {
    auto v = bus_.read(topic);
    if (!v) return std::nullopt;
    double d = v->as_double();
    if (d == 0.0) return false;
    if (d == 1.0) return true;
    report_malformed(topic, *v, "flag must be 0 or 1");
    return std::nullopt;
}

bool TransportBridge::wait_for(const std::function<bool()>& pred, float timeout_ms) const {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::microseconds(
        static_cast<int64_t>(timeout_ms * 1000.0f));

    while (true) {
        if (pred()) return true;
        if (Clock::now() >= deadline) return false;
        if (cfg_.poll_interval_ms > 0.0f) {
            std::this_thread::sleep_for(std::chrono::microseconds(
                static_cast<int64_t>(cfg_.poll_interval_ms * 1000.0f)));
        } else {
            std::this_thread::yield();
        }
    }
}

bool TransportBridge::wait_for_ack(int64_t seq, float timeout_ms) {
    return wait_for([this, seq]() {
        auto ack = read_int(topic::ACK_SEQ);
        return ack && *ack == seq;
    }, timeout_ms);
}

} // namespace mazerl
