/**
 * test_transport.cpp — 消息总线 + 同步层测试
 *
 * 验证:
 * 1. 最后值覆盖: 未发布 → 缺席, 重复发布 → 只保留最新值
 * 2. 类型化读取: NaN/非整数/超出 int64/非法 flag → 缺席 + 计数
 * 3. 有界等待: 谓词永不成立时按时返回 false, 不挂起
 * 4. 命令关联: 旧 ack 不会被当作新命令的应答
 * 5. 发布钩子: 钩子内可再次发布 (lockstep 模拟器依赖这一点)
 * 6. 跨线程: 另一线程延迟写入 ack, 等待方能收到
 */

#include "core/message_bus.h"
#include "core/transport_bridge.h"
#include "test_utils.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <limits>
#include <thread>

using namespace mazerl;

static int g_pass = 0, g_fail = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("  [FAIL] %s (line %d)\n", msg, __LINE__); \
        g_fail++; return; \
    } \
} while(0)

// =========================================================================
// Test 1: last-value-wins
// =========================================================================
static void test_last_value_wins() {
    printf("\n--- 测试1: 最后值覆盖 ---\n");

    LastValueBus bus;
    TEST_ASSERT(!bus.read("X").has_value(), "Unpublished topic is absent");

    bus.publish_float("X", 1.0);
    bus.publish_float("X", 2.0);
    bus.publish_float("X", 3.5);
    auto v = bus.read("X");
    TEST_ASSERT(v.has_value(), "Published topic present");
    TEST_ASSERT(v->type == BusType::FLOAT, "Type preserved");
    TEST_ASSERT(v->f == 3.5, "Only the latest value is kept");
    TEST_ASSERT(bus.n_topics() == 1, "One slot per topic");
    TEST_ASSERT(bus.publish_count() == 3, "Every publish counted");

    bus.publish_int("Action", 2);
    TEST_ASSERT(bus.read("Action")->i == 2, "Int value");
    TEST_ASSERT(bus.read("Action")->as_double() == 2.0, "Int as double");

    bus.clear();
    TEST_ASSERT(!bus.read("X").has_value(), "clear() → absent");
    TEST_ASSERT(bus.n_topics() == 0, "clear() empties all slots");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: malformed values
// =========================================================================
static void test_malformed_values() {
    printf("\n--- 测试2: 非法消息视为缺席 ---\n");

    LastValueBus bus;
    TransportBridge bridge(bus);

    bus.publish_float(topic::X, std::numeric_limits<double>::quiet_NaN());
    TEST_ASSERT(!bridge.read_float(topic::X).has_value(), "NaN pose dropped");
    bus.publish_float(topic::Y, std::numeric_limits<double>::infinity());
    TEST_ASSERT(!bridge.read_float(topic::Y).has_value(), "Inf pose dropped");

    bus.publish_float(topic::CHECKPOINT, 1.5);
    TEST_ASSERT(!bridge.read_int(topic::CHECKPOINT).has_value(), "Non-integral id dropped");
    bus.publish_float(topic::CHECKPOINT, 2.0);
    TEST_ASSERT(bridge.read_int(topic::CHECKPOINT).value_or(-1) == 2, "Integral float accepted");
    bus.publish_float(topic::CHECKPOINT, 1e30);
    TEST_ASSERT(!bridge.read_int(topic::CHECKPOINT).has_value(), "Integral float beyond int64 dropped");
    bus.publish_float(topic::CHECKPOINT, -1e30);
    TEST_ASSERT(!bridge.read_int(topic::CHECKPOINT).has_value(), "Negative float beyond int64 dropped");

    bus.publish_int(topic::COLLISION, 7);
    TEST_ASSERT(!bridge.read_flag(topic::COLLISION).has_value(), "Flag 7 dropped");
    bus.publish_int(topic::COLLISION, 1);
    TEST_ASSERT(bridge.read_flag(topic::COLLISION).value_or(false), "Flag 1 accepted");
    bus.publish_float(topic::GOAL, 0.0);
    TEST_ASSERT(bridge.read_flag(topic::GOAL).has_value() && !*bridge.read_flag(topic::GOAL),
                "Flag 0.0 accepted as false");

    TEST_ASSERT(bridge.malformed_count() == 6, "6 malformed messages counted");
    TEST_ASSERT(!bridge.read_float("never_published").has_value(), "Absent stays absent");
    TEST_ASSERT(bridge.malformed_count() == 6, "Absence is not malformed");

    printf("  Malformed: %zu\n", bridge.malformed_count());
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: bounded wait
// =========================================================================
static void test_bounded_wait() {
    printf("\n--- 测试3: 有界等待 ---\n");

    LastValueBus bus;
    BusWaitConfig wcfg;
    wcfg.poll_interval_ms = 1.0f;
    TransportBridge bridge(bus, wcfg);

    auto t0 = std::chrono::steady_clock::now();
    bool ok = bridge.wait_for([]() { return false; }, 50.0f);
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    TEST_ASSERT(!ok, "Never-true predicate times out");
    TEST_ASSERT(ms >= 45.0, "Waited roughly the timeout");
    TEST_ASSERT(ms < 1000.0, "Returned promptly after the timeout");

    TEST_ASSERT(bridge.wait_for([]() { return true; }, 0.0f), "Immediately true predicate");
    TEST_ASSERT(!bridge.wait_for_ack(1, 0.0f), "No ack on empty bus");

    printf("  Timed out after %.1f ms\n", ms);
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: stale acknowledgement
// =========================================================================
static void test_stale_ack() {
    printf("\n--- 测试4: 旧应答不被误认 ---\n");

    LastValueBus bus;
    // 模拟器残留的应答 (上一次运行)
    bus.publish_int(topic::ACK_SEQ, 17);

    TransportBridge bridge(bus);
    int64_t seq = bridge.next_sequence();
    TEST_ASSERT(seq == 18, "Sequence continues after the ack already on the bus");
    TEST_ASSERT(!bridge.wait_for_ack(seq, 20.0f), "Stale ack 17 does not satisfy seq 18");

    bus.publish_int(topic::ACK_SEQ, seq);
    TEST_ASSERT(bridge.wait_for_ack(seq, 20.0f), "Matching ack accepted");

    int64_t seq2 = bridge.next_sequence();
    TEST_ASSERT(seq2 > seq, "Sequence strictly increasing");
    TEST_ASSERT(!bridge.wait_for_ack(seq2, 10.0f), "Previous ack is stale for the next command");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: publish hook
// =========================================================================
static void test_publish_hook() {
    printf("\n--- 测试5: 发布钩子 ---\n");

    LastValueBus bus;
    int calls = 0;
    bus.set_publish_hook([&](const std::string& t, const BusValue& v) {
        calls++;
        if (t == topic::STEP_SEQ) bus.publish_int(topic::ACK_SEQ, v.i);
    });

    TransportBridge bridge(bus);
    int64_t seq = bridge.next_sequence();
    bridge.publish_int(topic::STEP_SEQ, seq);
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == seq, "Hook answered synchronously");
    TEST_ASSERT(bridge.wait_for_ack(seq, 0.0f), "Ack visible without waiting");
    TEST_ASSERT(calls == 2, "Hook sees its own publication too");

    bus.set_publish_hook(nullptr);
    bus.publish_int(topic::STEP_SEQ, 99);
    TEST_ASSERT(calls == 2, "Hook removed");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: cross-thread acknowledgement
// =========================================================================
static void test_cross_thread_ack() {
    printf("\n--- 测试6: 跨线程应答 ---\n");

    LastValueBus bus;
    TransportBridge bridge(bus);
    int64_t seq = bridge.next_sequence();

    std::thread sim([&bus, seq]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        bus.publish_float(topic::X, 21.0);
        bus.publish_int(topic::ACK_SEQ, seq);
    });

    bool ok = bridge.wait_for_ack(seq, 2000.0f);
    sim.join();

    TEST_ASSERT(ok, "Ack from another thread received");
    TEST_ASSERT(bridge.read_float(topic::X).value_or(0.0) == 21.0, "Data published before ack visible");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== MazeRL 消息总线测试 ===\n");

    test_last_value_wins();
    test_malformed_values();
    test_bounded_wait();
    test_stale_ack();
    test_publish_hook();
    test_cross_thread_ack();

    printf("\n========================================\n");
    printf("  通过: %d / %d\n", g_pass, g_pass + g_fail);
    printf("========================================\n");
    return g_fail > 0 ? 1 : 0;
}
