/**
 * test_grid_world.cpp — 参考模拟器测试
 *
 * 验证:
 * 1. 迷宫预设: 最短路长度, 检查点数量
 * 2. 墙壁/越界碰撞, 原地不动
 * 3. 检查点每次 reset 后只报告一次, reset_checkpoints 重新武装
 * 4. 生成迷宫: 连通, 检查点按顺序位于最短路上
 * 5. 自定义布局校验
 * 6. GridSimulator lockstep: 命令应答 + 位姿/朝向发布
 * 7. reset 丢弃尚未处理的 step, 之后的 step 从起点开始
 */

#include "sim/grid_world.h"
#include "sim/grid_simulator.h"
#include "test_utils.h"

#include <cmath>
#include <cstdio>

using namespace mazerl;

static int g_pass = 0, g_fail = 0;

#define TEST_ASSERT(cond, msg) do { \
    if (!(cond)) { \
        printf("  [FAIL] %s (line %d)\n", msg, __LINE__); \
        g_fail++; return; \
    } \
} while(0)

static GridWorldConfig preset(MazeType t) {
    GridWorldConfig cfg;
    cfg.maze_type = t;
    return cfg;
}

static Action step_towards(int x, int y, int nx, int ny) {
    if (nx > x) return Action::RIGHT;
    if (nx < x) return Action::LEFT;
    if (ny > y) return Action::DOWN;
    return Action::UP;
}

// =========================================================================
// Test 1: presets
// =========================================================================
static void test_presets() {
    printf("\n--- 测试1: 迷宫预设 ---\n");

    GridWorld open(preset(MazeType::OPEN_3X3));
    TEST_ASSERT(open.width() == 3 && open.height() == 3, "open3x3 size");
    TEST_ASSERT(open.shortest_path_length() == 4, "open3x3 shortest path 4");
    TEST_ASSERT(open.n_checkpoints() == 0, "open3x3 has no checkpoints");

    GridWorld corridor(preset(MazeType::CORRIDOR));
    TEST_ASSERT(corridor.shortest_path_length() == 9, "corridor shortest path 9");
    TEST_ASSERT(corridor.n_checkpoints() == 2, "corridor has 2 checkpoints");
    TEST_ASSERT(corridor.checkpoint_at(3, 0) == 1 && corridor.checkpoint_at(6, 0) == 2, "corridor checkpoint cells");

    GridWorld classic(preset(MazeType::CLASSIC_10X10));
    TEST_ASSERT(classic.width() == 10 && classic.height() == 10, "classic size");
    TEST_ASSERT(classic.shortest_path_length() == 24, "classic shortest path 24");
    TEST_ASSERT(classic.n_checkpoints() == 4, "classic has 4 checkpoints");
    TEST_ASSERT(classic.goal_x() == 9 && classic.goal_y() == 9, "classic goal (9,9)");

    MazeType t;
    TEST_ASSERT(parse_maze_type("generated", t) && t == MazeType::GENERATED, "Parse generated");
    TEST_ASSERT(!parse_maze_type("labyrinth", t), "Unknown maze rejected");

    printf("%s", classic.to_string().c_str());
    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 2: collisions
// =========================================================================
static void test_collisions() {
    printf("\n--- 测试2: 碰撞 ---\n");

    GridWorld w(preset(MazeType::CLASSIC_10X10));

    MoveResult r = w.act(Action::UP);           // out of bounds
    TEST_ASSERT(r.collision, "Out of bounds → collision");
    TEST_ASSERT(r.x == 0 && r.y == 0, "Stayed in place");

    r = w.act(Action::RIGHT);                   // (1,0) wall
    TEST_ASSERT(r.collision, "Wall → collision");
    TEST_ASSERT(w.agent_x() == 0 && w.agent_y() == 0, "Agent did not move");

    r = w.act(Action::DOWN);
    TEST_ASSERT(!r.collision && r.x == 0 && r.y == 1, "Free move");
    TEST_ASSERT(w.total_collisions() == 2 && w.total_steps() == 3, "Counters");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 3: checkpoint latch
// =========================================================================
static void test_checkpoint_latch() {
    printf("\n--- 测试3: 检查点锁存 ---\n");

    GridWorld w(preset(MazeType::CORRIDOR));
    w.act(Action::RIGHT);
    w.act(Action::RIGHT);
    MoveResult r = w.act(Action::RIGHT);        // (3,0)
    TEST_ASSERT(r.checkpoint == 1, "Checkpoint 1 reported");

    w.act(Action::LEFT);
    r = w.act(Action::RIGHT);
    TEST_ASSERT(r.checkpoint == 0, "Not reported twice");

    w.reset_checkpoints();
    w.act(Action::LEFT);
    r = w.act(Action::RIGHT);
    TEST_ASSERT(r.checkpoint == 1, "Re-armed by reset_checkpoints");

    w.reset();
    TEST_ASSERT(w.agent_x() == 0 && w.agent_y() == 0, "reset → start");
    for (int i = 0; i < 3; ++i) r = w.act(Action::RIGHT);
    TEST_ASSERT(r.checkpoint == 1, "Re-armed by reset");

    for (int i = 0; i < 6; ++i) r = w.act(Action::RIGHT);
    TEST_ASSERT(r.goal && r.x == 9, "Goal at the end of the corridor");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 4: generated maze
// =========================================================================
static void test_generated() {
    printf("\n--- 测试4: 生成迷宫 ---\n");

    for (uint32_t seed = 1; seed <= 5; ++seed) {
        GridWorldConfig cfg;
        cfg.maze_type = MazeType::GENERATED;
        cfg.width = 10;       // even → 11
        cfg.height = 11;
        cfg.n_checkpoints = 3;
        cfg.seed = seed;
        GridWorld w(cfg);

        TEST_ASSERT(w.width() == 11 && w.height() == 11, "Odd dimensions");
        auto path = w.shortest_path();
        TEST_ASSERT(!path.empty(), "Goal reachable");
        TEST_ASSERT(w.n_checkpoints() == 3, "3 checkpoints placed");

        // Walk the shortest path: checkpoints appear in order 1, 2, 3, then the goal
        int expected = 1;
        MoveResult r;
        for (size_t i = 1; i < path.size(); ++i) {
            r = w.act(step_towards(path[i - 1].first, path[i - 1].second,
                                   path[i].first, path[i].second));
            TEST_ASSERT(!r.collision, "Shortest path never hits a wall");
            if (r.checkpoint != 0) {
                TEST_ASSERT(r.checkpoint == expected, "Checkpoints in order along the path");
                expected++;
            }
        }
        TEST_ASSERT(expected == 4, "All checkpoints on the path");
        TEST_ASSERT(r.goal, "Path ends at the goal");
    }

    // Same seed → same maze
    GridWorldConfig cfg;
    cfg.maze_type = MazeType::GENERATED;
    cfg.seed = 99;
    TEST_ASSERT(GridWorld(cfg).to_string() == GridWorld(cfg).to_string(), "Deterministic per seed");

    // Large grid: explicit stack, no recursion
    cfg.width = 301;
    cfg.height = 301;
    GridWorld big(cfg);
    TEST_ASSERT(big.shortest_path_length() > 0, "Large maze connected");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 5: custom layouts
// =========================================================================
static void test_custom_layout() {
    printf("\n--- 测试5: 自定义布局 ---\n");

    GridWorld w(preset(MazeType::OPEN_3X3));
    TEST_ASSERT(!w.load_layout({}), "Empty layout rejected");
    TEST_ASSERT(!w.load_layout({"S..", "..G."}), "Ragged rows rejected");
    TEST_ASSERT(!w.load_layout({"S.x", "..G"}), "Unknown character rejected");
    TEST_ASSERT(!w.load_layout({"...", "..G"}), "Missing start rejected");
    TEST_ASSERT(w.width() == 3 && w.shortest_path_length() == 4, "Rejected layouts leave the maze unchanged");

    TEST_ASSERT(w.load_layout({"S#G", ".#."}), "Valid layout accepted");
    TEST_ASSERT(w.shortest_path_length() == -1, "Walled-off goal unreachable");

    GridWorldConfig cfg;
    cfg.maze_type = MazeType::CUSTOM;
    cfg.layout = {"S1.", "##.", "G2."};
    GridWorld c(cfg);
    TEST_ASSERT(c.n_checkpoints() == 2, "Custom checkpoints");
    TEST_ASSERT(c.shortest_path_length() == 6, "Custom path length");

    cfg.layout = {"bad"};
    GridWorld fallback(cfg);
    TEST_ASSERT(fallback.shortest_path_length() == 24, "Invalid custom falls back to classic");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 6: lockstep simulator
// =========================================================================
static void test_lockstep_simulator() {
    printf("\n--- 测试6: lockstep 模拟器 ---\n");

    LastValueBus bus;
    SimConfig cfg;
    cfg.world.maze_type = MazeType::CORRIDOR;
    cfg.cell_size = 2.0f;
    cfg.publish_z = true;
    GridSimulator sim(bus, cfg);
    sim.enable_lockstep();
    TEST_ASSERT(!sim.start(), "Threaded start refused in lockstep mode");

    bus.publish_int(topic::RESET, 1);
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 1, "Reset acknowledged");
    TEST_ASSERT(bus.read(topic::X)->f == 0.0, "Pose at start");
    TEST_ASSERT(bus.read(topic::Z).has_value(), "Z published when enabled");

    bus.publish_int(topic::ACTION, static_cast<int64_t>(action_index(Action::RIGHT)));
    bus.publish_int(topic::STEP_SEQ, 2);
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 2, "Step acknowledged");
    TEST_ASSERT(bus.read(topic::X)->f == 2.0, "X = cell × cell_size");
    TEST_ASSERT(bus.read(topic::THETA)->f == 0.0, "Heading east");
    TEST_ASSERT(bus.read(topic::COLLISION)->i == 0, "No collision");

    bus.publish_int(topic::ACTION, static_cast<int64_t>(action_index(Action::UP)));
    bus.publish_int(topic::STEP_SEQ, 3);
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 3, "Collision step acknowledged");
    TEST_ASSERT(bus.read(topic::COLLISION)->i == 1, "Collision flag");
    TEST_ASSERT(bus.read(topic::THETA)->f == 0.0, "Heading unchanged by a collision");

    bus.publish_int(topic::ACTION, static_cast<int64_t>(action_index(Action::LEFT)));
    bus.publish_int(topic::STEP_SEQ, 4);
    TEST_ASSERT(std::fabs(bus.read(topic::THETA)->f - 3.14159265358979) < 1e-6, "Heading west = π");

    // Invalid action: no move, still acknowledged
    bus.publish_int(topic::ACTION, 7);
    bus.publish_int(topic::STEP_SEQ, 5);
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 5, "Invalid action acknowledged");
    TEST_ASSERT(sim.world().agent_x() == 0, "Invalid action does not move");

    bus.publish_int(topic::MODE, 1);
    TEST_ASSERT(sim.mode() == 1, "Mode command applied");

    TEST_ASSERT(sim.commands_handled() == 5, "1 reset + 4 steps");

    printf("  [PASS]\n"); g_pass++;
}

// =========================================================================
// Test 7: reset abandons a step issued before it
// =========================================================================
static void test_reset_abandons_step() {
    printf("\n--- 测试7: reset 丢弃未处理的 step ---\n");

    LastValueBus bus;
    SimConfig cfg;
    cfg.world.maze_type = MazeType::OPEN_3X3;
    GridSimulator sim(bus, cfg);

    // Step and reset both land before the next frame
    bus.publish_int(topic::ACTION, static_cast<int64_t>(action_index(Action::RIGHT)));
    bus.publish_int(topic::STEP_SEQ, 5);
    bus.publish_int(topic::RESET, 6);

    sim.frame();
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 6, "Reset acknowledged");
    TEST_ASSERT(sim.world().agent_x() == 0 && sim.world().agent_y() == 0, "Agent at start");

    sim.frame();
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 6, "Abandoned step not replayed");
    TEST_ASSERT(sim.world().agent_x() == 0 && sim.world().agent_y() == 0, "Agent still at start");

    bus.publish_int(topic::STEP_SEQ, 7);
    sim.frame();
    TEST_ASSERT(bus.read(topic::ACK_SEQ)->i == 7, "Next step acknowledged");
    TEST_ASSERT(sim.world().agent_x() == 1 && sim.world().agent_y() == 0, "First move starts from S");
    TEST_ASSERT(sim.commands_handled() == 2, "1 reset + 1 step");

    printf("  [PASS]\n"); g_pass++;
}

int main() {
    init_test_console();
    printf("=== MazeRL 参考模拟器测试 ===\n");

    test_presets();
    test_collisions();
    test_checkpoint_latch();
    test_generated();
    test_custom_layout();
    test_lockstep_simulator();
    test_reset_abandons_step();

    printf("\n========================================\n");
    printf("  通过: %d / %d\n", g_pass, g_pass + g_fail);
    printf("========================================\n");
    return g_fail > 0 ? 1 : 0;
}
