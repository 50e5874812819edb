/**
 * test_maze_env.cpp — 总线驱动迷宫环境测试
 *
 * 验证:
 * 1. 基本一步: 发布动作 + 序列号, 读取位姿 → 新状态, 奖励 = step_cost
 * 2. 碰撞: step_cost + collision, streak 清零, 不触发循环检测
 * 3. 检查点: 只按 1,2,3... 顺序领取, 每个至多一次, 越界 id 忽略
 * 4. 循环惩罚: 进入循环罚一次, 离开窗口后再次进入再罚
 * 5. 碰撞上限: 恰好第 N 次碰撞终止
 * 6. 步数上限
 * 7. 到达目标 + streak 奖励
 * 8. 传输超时: 无模拟器时有界返回 fault, 不挂起
 * 9. 参考模拟器 (lockstep) 上的经典迷宫开局
 * 10. 参考模拟器 (threaded + real 模式) 走到 3×3 目标
 * 11. 非法动作: 不发布, fault + INVALID_ACTION
 */

#include "engine/maze_env.h"
#include "sim/grid_simulator.h"
#include "test_utils.h"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

using namespace mazerl;

static int g_pass = 0, g_fail = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("  [FAIL] %s (line %d)\n", msg, __LINE__); \
        g_fail++; return; \
    } \
} while(0)

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static EnvConfig test_env_config() {
    EnvConfig cfg;
    cfg.rewards.step_cost = -1.0;
    cfg.rewards.collision = -13.0;
    cfg.rewards.goal_reached = 1000.0;
    cfg.rewards.streak_bonus = 20.0;
    cfg.rewards.loop_penalty = -13.0;
    cfg.rewards.checkpoint_bonuses = {50.0, 150.0, 300.0, 500.0};
    cfg.wait.step_timeout_ms = 500.0f;
    cfg.wait.reset_timeout_ms = 500.0f;
    return cfg;
}

// =========================================================================
// Test 1: basic step
// =========================================================================
static void test_basic_step() {
    printf("\n--- 测试1: 基本一步 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(move_to(1, 0));

    MazeEnvironment env(bus, test_env_config());
    State s0 = env.reset();
    TEST_ASSERT(env.last_reset_ok(), "Reset acknowledged");
    TEST_ASSERT(s0.x == 0 && s0.y == 0, "Start cell (0,0)");
    TEST_ASSERT(sim.resets_seen() == 1, "Simulator saw one reset");

    StepResult r = env.step(Action::RIGHT);
    TEST_ASSERT(sim.last_action() == static_cast<int64_t>(action_index(Action::RIGHT)), "Action index published");
    TEST_ASSERT(!r.done, "Not done");
    TEST_ASSERT(!r.info.fault, "No fault");
    TEST_ASSERT(r.next_state.x == 1 && r.next_state.y == 0, "Next state (1,0)");
    TEST_ASSERT(near(r.reward, -1.0), "Reward = step cost");
    TEST_ASSERT(r.info.outcome == MoveOutcome::MOVED, "Outcome MOVED");
    TEST_ASSERT(r.info.steps == 1 && env.step_count() == 1, "Step counted");
    TEST_ASSERT(r.info.streak == 1, "Streak 1");
    TEST_ASSERT(near(r.info.pos_x, 10.5), "Raw pose reported");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: collision
// =========================================================================
static void test_collision() {
    printf("\n--- 测试2: 碰撞 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(move_to(1, 0));
    sim.push(bump_at(1, 0));

    MazeEnvironment env(bus, test_env_config());
    env.reset();
    env.step(Action::RIGHT);
    StepResult r = env.step(Action::UP);

    // Staying in (1,0) is a revisit, but collision steps skip loop detection
    TEST_ASSERT(near(r.reward, -14.0), "Reward = step cost + collision");
    TEST_ASSERT(r.info.outcome == MoveOutcome::COLLISION, "Outcome COLLISION");
    TEST_ASSERT(!r.info.loop, "No loop penalty on a collision");
    TEST_ASSERT(r.info.collisions == 1 && env.collision_count() == 1, "Collision counted");
    TEST_ASSERT(r.info.streak == 0, "Streak reset");
    TEST_ASSERT(!r.done, "One collision does not end the episode");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: checkpoint ordering
// =========================================================================
static void test_checkpoint_order() {
    printf("\n--- 测试3: 检查点顺序 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(checkpoint_at(1, 0, 1));   // claim 1
    sim.push(checkpoint_at(2, 0, 1));   // 1 again
    sim.push(checkpoint_at(3, 0, 3));   // skips 2
    sim.push(checkpoint_at(4, 0, 2));   // claim 2
    sim.push(checkpoint_at(5, 0, 9));   // outside the schedule
    sim.push(checkpoint_at(6, 0, 3));   // claim 3

    MazeEnvironment env(bus, test_env_config());
    env.reset();

    const double expected[] = {49.0, -1.0, -1.0, 149.0, -1.0, 299.0};
    const int claimed[] = {1, 0, 0, 2, 0, 3};
    for (int i = 0; i < 6; ++i) {
        StepResult r = env.step(Action::RIGHT);
        printf("  step %d: reward=%.1f checkpoint=%d\n", i + 1, r.reward, r.info.checkpoint);
        TEST_ASSERT(near(r.reward, expected[i]), "Checkpoint reward");
        TEST_ASSERT(r.info.checkpoint == claimed[i], "Claimed id");
    }

    const auto& ids = env.claimed_checkpoints();
    TEST_ASSERT(ids.size() == 3, "Three claimed");
    TEST_ASSERT(ids[0] == 1 && ids[1] == 2 && ids[2] == 3, "Strictly increasing from 1");
    TEST_ASSERT(near(env.checkpoint_reward_total(), 500.0), "Total = 50 + 150 + 300");

    // A new episode starts from checkpoint 1 again
    env.reset();
    TEST_ASSERT(env.claimed_checkpoints().empty(), "Claims cleared on reset");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: loop penalty
// =========================================================================
static void test_loop_penalty() {
    printf("\n--- 测试4: 循环惩罚 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(move_to(1, 0));   // new
    sim.push(move_to(0, 0));   // enters a cycle → penalty
    sim.push(move_to(1, 0));   // still cycling → no second penalty
    sim.push(move_to(0, 0));   // still cycling
    sim.push(move_to(0, 1));   // new cell → leaves the cycle
    sim.push(move_to(0, 0));   // re-enters → penalty again

    EnvConfig cfg = test_env_config();
    cfg.loop_window = 6;
    MazeEnvironment env(bus, cfg);
    env.reset();

    const double expected[] = {-1.0, -14.0, -1.0, -1.0, -1.0, -14.0};
    const bool loops[] = {false, true, false, false, false, true};
    int penalties = 0;
    for (int i = 0; i < 6; ++i) {
        StepResult r = env.step(Action::RIGHT);
        TEST_ASSERT(near(r.reward, expected[i]), "Loop reward");
        TEST_ASSERT(r.info.loop == loops[i], "Loop flag");
        if (r.info.loop) penalties++;
    }
    TEST_ASSERT(penalties == 2, "Penalized once per re-entry");
    TEST_ASSERT(env.trace().size() <= cfg.loop_window, "Trace bounded by the window");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: collision limit
// =========================================================================
static void test_collision_limit() {
    printf("\n--- 测试5: 碰撞上限 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    for (int i = 0; i < 5; ++i) sim.push(bump_at(0, 0));

    EnvConfig cfg = test_env_config();
    cfg.collision_limit = 3;
    MazeEnvironment env(bus, cfg);
    env.reset();

    StepResult r1 = env.step(Action::UP);
    StepResult r2 = env.step(Action::UP);
    TEST_ASSERT(!r1.done && !r2.done, "Below the limit continues");
    StepResult r3 = env.step(Action::UP);
    TEST_ASSERT(r3.done, "Third collision ends the episode");
    TEST_ASSERT(r3.info.reason == Termination::COLLISION_LIMIT, "Reason COLLISION_LIMIT");
    TEST_ASSERT(!r3.info.success, "Not a success");
    TEST_ASSERT(r3.info.collisions == 3, "Exactly 3 collisions");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: step budget
// =========================================================================
static void test_step_budget() {
    printf("\n--- 测试6: 步数上限 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    for (int i = 1; i <= 10; ++i) sim.push(move_to(i, 0));

    EnvConfig cfg = test_env_config();
    cfg.max_steps = 5;
    MazeEnvironment env(bus, cfg);
    env.reset();

    StepResult r;
    int n = 0;
    do {
        r = env.step(Action::RIGHT);
        n++;
    } while (!r.done && n < 20);

    TEST_ASSERT(n == 5, "Ends after exactly max_steps");
    TEST_ASSERT(r.info.reason == Termination::STEP_BUDGET, "Reason STEP_BUDGET");
    TEST_ASSERT(r.info.steps == 5, "Step count 5");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 7: goal + streak
// =========================================================================
static void test_goal_streak() {
    printf("\n--- 测试7: 目标 + 连续无碰撞奖励 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(move_to(1, 0));
    sim.push(move_to(2, 0));
    sim.push(bump_at(2, 0));
    sim.push(move_to(3, 0));
    sim.push(move_to(4, 0));
    sim.push(goal_at(5, 0));

    MazeEnvironment env(bus, test_env_config());
    env.reset();

    StepResult r;
    for (int i = 0; i < 6; ++i) r = env.step(Action::RIGHT);

    // Streak before the goal step: 2 (the collision reset it)
    TEST_ASSERT(r.done, "Goal ends the episode");
    TEST_ASSERT(r.info.success, "Success");
    TEST_ASSERT(r.info.reason == Termination::GOAL_REACHED, "Reason GOAL_REACHED");
    TEST_ASSERT(r.info.outcome == MoveOutcome::GOAL, "Outcome GOAL");
    TEST_ASSERT(near(r.reward, -1.0 + 1000.0 + 20.0 * 2), "Goal reward = step + goal + 20·streak");

    printf("  Goal reward: %.1f\n", r.reward);
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 8: transport timeout
// =========================================================================
static void test_transport_timeout() {
    printf("\n--- 测试8: 传输超时 ---\n");

    LastValueBus bus;   // nobody answers
    EnvConfig cfg = test_env_config();
    cfg.wait.step_timeout_ms = 50.0f;
    cfg.wait.reset_timeout_ms = 50.0f;
    MazeEnvironment env(bus, cfg);

    auto t0 = std::chrono::steady_clock::now();
    env.reset();
    TEST_ASSERT(!env.last_reset_ok(), "Reset reports the missing acknowledgement");

    StepResult r = env.step(Action::DOWN);
    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();

    TEST_ASSERT(r.info.fault, "Fault flagged");
    TEST_ASSERT(r.done, "Fault ends the episode");
    TEST_ASSERT(r.info.reason == Termination::TRANSPORT_TIMEOUT, "Reason TRANSPORT_TIMEOUT");
    TEST_ASSERT(r.info.outcome == MoveOutcome::FAULT, "Outcome FAULT");
    TEST_ASSERT(r.reward == 0.0, "No reward for an unknown transition");
    TEST_ASSERT(ms < 2000.0, "Returned within the bound");

    // Simulator goes silent mid-episode
    LastValueBus bus2;
    ScriptedSimulator sim(bus2);
    sim.push(move_to(1, 0));
    sim.push(silent());
    MazeEnvironment env2(bus2, cfg);
    env2.reset();
    StepResult ok = env2.step(Action::RIGHT);
    StepResult lost = env2.step(Action::RIGHT);
    TEST_ASSERT(!ok.info.fault, "First step answered");
    TEST_ASSERT(lost.info.fault && lost.done, "Silent simulator → fault");
    TEST_ASSERT(lost.next_state.x == 1, "State stays at the last acknowledged cell");

    printf("  Timed out in %.1f ms\n", ms);
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 9: reference simulator, lockstep
// =========================================================================
static void test_reference_simulator_lockstep() {
    printf("\n--- 测试9: 参考模拟器 (lockstep) ---\n");

    LastValueBus bus;
    SimConfig scfg;
    scfg.world.maze_type = MazeType::CLASSIC_10X10;
    GridSimulator sim(bus, scfg);
    sim.enable_lockstep();

    MazeEnvironment env(bus, test_env_config());
    State s = env.reset();
    TEST_ASSERT(env.last_reset_ok(), "Reset acknowledged by the simulator");
    TEST_ASSERT(s.x == 0 && s.y == 0, "Start (0,0)");

    StepResult r = env.step(Action::RIGHT);     // (1,0) is a wall
    TEST_ASSERT(r.info.outcome == MoveOutcome::COLLISION, "Wall → collision");
    TEST_ASSERT(near(r.reward, -14.0), "Collision reward");

    r = env.step(Action::DOWN);                 // (0,1)
    TEST_ASSERT(r.next_state.x == 0 && r.next_state.y == 1, "Moved down");
    TEST_ASSERT(near(r.reward, -1.0), "Plain step");

    env.step(Action::RIGHT);                    // (1,1)
    env.step(Action::RIGHT);                    // (2,1)
    r = env.step(Action::RIGHT);                // (3,1) = checkpoint 1
    TEST_ASSERT(r.info.checkpoint == 1, "Checkpoint 1 reached");
    TEST_ASSERT(near(r.reward, 49.0), "Checkpoint bonus 50");
    TEST_ASSERT(near(r.info.theta, 0.0), "Heading east");

    TEST_ASSERT(sim.commands_handled() == 6, "1 reset + 5 steps handled");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 10: reference simulator, threaded + real mode
// =========================================================================
static void test_reference_simulator_threaded() {
    printf("\n--- 测试10: 参考模拟器 (threaded, real 模式) ---\n");

    LastValueBus bus;
    SimConfig scfg;
    scfg.world.maze_type = MazeType::OPEN_3X3;
    scfg.frame_ms = 2.0f;
    scfg.frames_per_move = 3;
    GridSimulator sim(bus, scfg);
    TEST_ASSERT(sim.start(), "Simulator thread started");

    EnvConfig cfg = test_env_config();
    cfg.wait.step_timeout_ms = 2000.0f;
    cfg.wait.reset_timeout_ms = 2000.0f;
    MazeEnvironment env(bus, cfg);
    env.set_mode(1);

    env.reset();
    TEST_ASSERT(env.last_reset_ok(), "Reset acknowledged asynchronously");

    const Action path[] = {Action::RIGHT, Action::RIGHT, Action::DOWN, Action::DOWN};
    StepResult r;
    for (Action a : path) {
        r = env.step(a);
        TEST_ASSERT(!r.info.fault, "Every step acknowledged");
    }
    sim.stop();

    TEST_ASSERT(r.done && r.info.success, "Goal reached at (2,2)");
    TEST_ASSERT(r.next_state.x == 2 && r.next_state.y == 2, "Final state (2,2)");
    TEST_ASSERT(sim.mode() == 1, "Mode command applied");
    TEST_ASSERT(sim.frame_count() > 0, "Simulator ticked");
    TEST_ASSERT(bus.read(topic::TICK).has_value(), "Tick published");

    printf("  Frames: %llu\n", static_cast<unsigned long long>(sim.frame_count()));
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 11: action outside the action set
// =========================================================================
static void test_invalid_action() {
    printf("\n--- 测试11: 非法动作 ---\n");

    LastValueBus bus;
    ScriptedSimulator sim(bus);
    sim.push(move_to(1, 0));

    MazeEnvironment env(bus, test_env_config());
    env.reset();
    TEST_ASSERT(env.last_reset_ok(), "Reset acknowledged");

    StepResult r = env.step(static_cast<Action>(9));
    TEST_ASSERT(r.info.fault && r.done, "Invalid action ends the episode");
    TEST_ASSERT(r.info.reason == Termination::INVALID_ACTION, "Reason INVALID_ACTION");
    TEST_ASSERT(std::string(termination_name(r.info.reason)) == "invalid_action", "Reason name");
    TEST_ASSERT(r.info.outcome == MoveOutcome::FAULT, "Outcome FAULT");
    TEST_ASSERT(sim.steps_seen() == 0, "Nothing published to the simulator");
    TEST_ASSERT(env.step_count() == 0, "Not counted as a step");
    TEST_ASSERT(r.next_state.x == 0 && r.next_state.y == 0, "State unchanged");

    r = env.step(Action::RIGHT);
    TEST_ASSERT(!r.info.fault && r.next_state.x == 1, "Valid action still works");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== MazeRL 迷宫环境测试 ===\n");

    test_basic_step();
    test_collision();
    test_checkpoint_order();
    test_loop_penalty();
    test_collision_limit();
    test_step_budget();
    test_goal_streak();
    test_transport_timeout();
    test_reference_simulator_lockstep();
    test_reference_simulator_threaded();
    test_invalid_action();

    printf("\n========================================\n");
    printf("  通过: %d / %d\n", g_pass, g_pass + g_fail);
    printf("========================================\n");
    return g_fail > 0 ? 1 : 0;
}
