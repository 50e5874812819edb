/**
 * benchmark_strategies — 三种探索策略在同一迷宫上的对比
 *
 * 每个 (策略, 种子) 组合: lockstep 模拟器上训练 N 个 episode, 再做 5 个贪心测试 episode。
 * 各组合完全独立 (各自的总线/模拟器/agent), OpenMP 可用时并行运行。
 *
 * Usage: benchmark_strategies [episodes] [seeds] [maze]
 *   defaults: 300 episodes, 3 seeds, classic
 */

#include "engine/session.h"
#include "engine/run_config.h"
#include "core/log.h"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#ifdef MAZERL_OPENMP
#include <omp.h>
#endif

#ifdef _WIN32
#include <windows.h>
#endif

using namespace mazerl;

struct BenchResult {
    StrategyKind kind = StrategyKind::EPSILON_GREEDY;
    uint32_t seed           = 0;
    double   train_success  = 0.0;   // 最后 50 个训练 episode
    double   train_steps    = 0.0;
    double   train_reward   = 0.0;
    int      first_goal     = -1;    // 第一次到达目标的 episode
    uint32_t test_successes = 0;
    double   test_steps     = 0.0;
    size_t   states         = 0;
};

static BenchResult run_one(StrategyKind kind, uint32_t seed, uint32_t episodes, MazeType maze) {
    RunConfig cfg;
    cfg.strategy.kind = kind;
    cfg.strategy.seed = seed;
    cfg.sim.world.maze_type = maze;
    cfg.sim.world.seed = seed;
    cfg.training.load_existing = false;
    cfg.training.save_model = false;

    BenchResult res;
    res.kind = kind;
    res.seed = seed;

    TrainingSession session(cfg);
    session.trainer().set_callback([&res](const EpisodeStats& st) {
        if (st.success && res.first_goal < 0) res.first_goal = static_cast<int>(st.episode);
    });
    if (!session.train(episodes)) {
        MAZERL_LOG_WARN("%s seed=%u: training reported a failure", strategy_name(kind), seed);
    }

    TrainingSummary s = session.summary(50);
    res.train_success = s.success_rate;
    res.train_steps   = s.mean_steps;
    res.train_reward  = s.mean_reward;
    res.states        = s.states_explored;

    auto tests = session.test(5);
    for (const auto& t : tests) {
        if (t.success) res.test_successes++;
        res.test_steps += t.steps;
    }
    if (!tests.empty()) res.test_steps /= tests.size();
    return res;
}

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif

    uint32_t episodes = 300;
    uint32_t n_seeds  = 3;
    MazeType maze     = MazeType::CLASSIC_10X10;
    if (argc >= 2) episodes = static_cast<uint32_t>(std::atoi(argv[1]));
    if (argc >= 3) n_seeds  = static_cast<uint32_t>(std::atoi(argv[2]));
    if (argc >= 4 && !parse_maze_type(argv[3], maze)) {
        fprintf(stderr, "unknown maze '%s'\n", argv[3]);
        return 2;
    }
    if (n_seeds == 0) n_seeds = 1;

    set_log_level(LogLevel::WARN);

    const StrategyKind kinds[] = {
        StrategyKind::EPSILON_GREEDY, StrategyKind::UCB, StrategyKind::CURIOSITY
    };
    const uint32_t base_seeds[] = {42, 77, 123, 256, 789, 1024, 2024, 4096};
    const uint32_t n_base = sizeof(base_seeds) / sizeof(base_seeds[0]);

    printf("=== Strategy Benchmark (%s maze, %u episodes x %u seeds) ===\n",
           maze_type_name(maze), episodes, n_seeds);
#ifdef MAZERL_OPENMP
    printf("  OpenMP threads: %d\n", omp_get_max_threads());
#endif
    printf("\n");

    std::vector<BenchResult> results(3 * n_seeds);
    int n_runs = static_cast<int>(results.size());

    auto t0 = std::chrono::steady_clock::now();
#ifdef MAZERL_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int r = 0; r < n_runs; ++r) {
        StrategyKind kind = kinds[r % 3];
        uint32_t seed = base_seeds[(r / 3) % n_base] + (r / 3) / n_base;
        results[r] = run_one(kind, seed, episodes, maze);
    }
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    for (const auto& r : results) {
        printf("  %-15s seed=%4u | last50 success=%5.1f%% steps=%6.1f reward=%8.1f"
               " | first goal=%4d | test %u/5 (%.1f steps) | states=%zu\n",
               strategy_name(r.kind), r.seed, 100.0 * r.train_success, r.train_steps,
               r.train_reward, r.first_goal, r.test_successes, r.test_steps, r.states);
    }

    printf("\n=== Summary ===\n");
    for (auto kind : kinds) {
        double success = 0.0, steps = 0.0, test = 0.0;
        int n = 0;
        for (const auto& r : results) {
            if (r.kind != kind) continue;
            success += r.train_success;
            steps   += r.train_steps;
            test    += r.test_successes / 5.0;
            n++;
        }
        if (n == 0) continue;
        printf("  %-15s success=%5.1f%%  mean steps=%6.1f  greedy test=%5.1f%%\n",
               strategy_name(kind), 100.0 * success / n, steps / n, 100.0 * test / n);
    }
    printf("\n  Elapsed: %.1f s\n", secs);
    return 0;
}
