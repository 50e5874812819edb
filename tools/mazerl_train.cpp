/**
 * mazerl_train — 迷宫 Q-learning 训练/测试/统计
 *
 * Usage: mazerl_train [train|test|stats] [options]
 *   --episodes N      训练/测试 episode 数
 *   --strategy NAME   epsilon_greedy | ucb | curiosity
 *   --maze NAME       open3x3 | corridor | classic | generated
 *   --model PATH      模型文件
 *   --threaded        模拟器跑自有时钟线程 (默认 lockstep)
 *   --real            real 模式 (位姿插值, 需 --threaded)
 *   --fresh           不加载已有模型
 *   --config FILE     key = value 覆盖文件
 *   --set key=value   单个覆盖 (可重复)
 *   --log LEVEL       error | warn | info | debug
 *
 * 返回码: 0 成功, 1 模型加载失败/训练失败, 2 参数错误
 */

#include "engine/session.h"
#include "engine/run_config.h"
#include "core/log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

using namespace mazerl;

static void print_usage() {
    printf("Usage: mazerl_train [train|test|stats] [--episodes N] [--strategy NAME]\n"
           "                    [--maze NAME] [--model PATH] [--threaded] [--real] [--fresh]\n"
           "                    [--config FILE] [--set key=value]... [--log LEVEL]\n\n"
           "Config keys:\n");
    for (const auto& k : override_keys()) printf("  %s\n", k.c_str());
}

int main(int argc, char* argv[]) {
#ifdef _WIN32
    SetConsoleOutputCP(65001);
#endif

    std::string mode = "train";
    RunConfig cfg;
    uint32_t episodes = 0;

    int i = 1;
    if (argc >= 2 && argv[1][0] != '-') {
        mode = argv[1];
        i = 2;
    }
    if (mode != "train" && mode != "test" && mode != "stats") {
        fprintf(stderr, "unknown mode '%s'\n", mode.c_str());
        print_usage();
        return 2;
    }

    bool ok = true;
    for (; i < argc && ok; ++i) {
        std::string arg = argv[i];
        bool has_next = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--episodes" && has_next) {
            episodes = static_cast<uint32_t>(std::atoi(argv[++i]));
        } else if (arg == "--strategy" && has_next) {
            ok = apply_override(cfg, "strategy.name", argv[++i]);
        } else if (arg == "--maze" && has_next) {
            ok = apply_override(cfg, "sim.maze", argv[++i]);
        } else if (arg == "--model" && has_next) {
            ok = apply_override(cfg, "training.model_path", argv[++i]);
        } else if (arg == "--threaded") {
            cfg.threaded = true;
        } else if (arg == "--real") {
            cfg.mode = 1;
        } else if (arg == "--fresh") {
            cfg.training.load_existing = false;
        } else if (arg == "--config" && has_next) {
            ok = load_overrides_file(cfg, argv[++i]);
        } else if (arg == "--set" && has_next) {
            ok = apply_override(cfg, std::string(argv[++i]));
        } else if (arg == "--log" && has_next) {
            ok = apply_override(cfg, "log.level", argv[++i]);
        } else {
            fprintf(stderr, "unknown or incomplete option '%s'\n", arg.c_str());
            ok = false;
        }
    }
    if (!ok) {
        print_usage();
        return 2;
    }

    set_log_level(cfg.log_level);

    printf("=== MazeRL: %s ===\n", mode.c_str());
    printf("  Maze: %s, simulator: %s%s\n", maze_type_name(cfg.sim.world.maze_type),
           cfg.threaded ? "threaded" : "lockstep", cfg.mode == 1 ? " (real)" : "");
    printf("  Strategy: %s, alpha=%.3f, gamma=%.3f\n",
           strategy_name(cfg.strategy.kind), cfg.agent.learning_rate, cfg.agent.discount_factor);
    printf("  Model: %s\n\n", cfg.training.model_path.c_str());

    TrainingSession session(cfg);

    if (mode == "train") {
        bool trained = session.train(episodes);
        session.shutdown();
        return trained ? 0 : 1;
    }

    // test / stats need a saved model
    LoadStatus st = session.load();
    if (st != LoadStatus::OK) {
        if (st == LoadStatus::NOT_FOUND) {
            MAZERL_LOG_ERROR("No trained model found at %s", cfg.training.model_path.c_str());
        }
        session.shutdown();
        return 1;
    }

    if (mode == "test") {
        auto results = session.test(episodes);
        session.shutdown();
        size_t successes = 0;
        for (const auto& r : results) if (r.success) successes++;
        printf("\n  Test: %zu/%zu goals\n", successes, results.size());
        return 0;
    }

    session.shutdown();
    TrainingSummary s = session.summary();
    const auto& agent = session.agent();
    printf("Model Statistics:\n");
    printf("  Episodes trained: %zu\n", s.total_episodes);
    printf("  States explored:  %zu\n", s.states_explored);
    printf("  Learning rate:    %.4f\n", agent.learning_rate());
    printf("  Strategy:         %s\n", agent.strategy().info().c_str());
    printf("  Last %zu episodes: reward=%.2f steps=%.1f success=%.1f%%\n",
           s.episodes, s.mean_reward, s.mean_steps, 100.0 * s.success_rate);
    if (s.best_episode > 0) {
        printf("  Best reward:      %.1f (episode %d)\n", s.best_reward, s.best_episode);
    }
    return 0;
}
