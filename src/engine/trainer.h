#pragma once
/**
 * Trainer — episode 循环
 *
 * train(n):
 *   for each episode:
 *     s = env.reset()
 *     loop: a = agent.select_action(s) → env.step(a) → agent.update(...) 直到 done
 *     strategy.decay(), agent.decay_learning_rate()
 *     每 save_every 个 episode 保存一次, 运行结束时再保存一次
 *
 * 传输故障 (info.fault) 终止当前 episode, 记为失败, 故障步不参与 Q 更新。
 * request_stop() 只在 episode 边界生效。
 *
 * Trainer 不定义奖励语义, 只记录 Environment 返回的结果。
 */

#include "engine/environment.h"
#include "agent/q_agent.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mazerl {

struct TrainerConfig {
    uint32_t    episodes      = 1000;
    uint32_t    save_every    = 10;     // 0 = 只在结束时保存
    std::string model_path    = "models/q_agent.bin";
    uint32_t    test_episodes = 10;
    size_t      stats_window  = 50;     // summary() 默认尾部窗口
    bool        load_existing = true;   // train() 开始前尝试恢复模型
    bool        save_model    = true;
};

/** 单个 episode 的统计 */
struct EpisodeStats {
    uint32_t    episode       = 0;
    double      total_reward  = 0.0;
    uint32_t    steps         = 0;
    bool        success       = false;
    Termination reason        = Termination::NONE;
    uint32_t    collisions    = 0;
    uint32_t    checkpoints   = 0;
    uint32_t    max_streak    = 0;
    bool        fault         = false;
    bool        learned       = true;   // false = 测试 episode
    double      epsilon       = 0.0;    // episode 结束时 (衰减前)
    double      learning_rate = 0.0;
};

/** 尾部窗口汇总 (基于 agent 持久化的 episode 历史, 含已加载模型的历史) */
struct TrainingSummary {
    size_t total_episodes  = 0;
    size_t episodes        = 0;     // 窗口内 episode 数
    double mean_reward     = 0.0;
    double mean_steps      = 0.0;
    double success_rate    = 0.0;
    size_t states_explored = 0;
    double best_reward     = 0.0;
    int    best_episode    = -1;
};

using EpisodeCallback = std::function<void(const EpisodeStats&)>;

class Trainer {
public:
    Trainer(Environment& env, QLearningAgent& agent, const TrainerConfig& config = {});

    /**
     * 训练 n 个 episode (n = 0 → config.episodes)。
     * 模型加载失败 (非 OK / NOT_FOUND) 时不训练, 返回 false。
     */
    bool train(uint32_t n = 0);

    /** 贪心评估 n 个 episode (无探索, 无更新, 不计数) */
    std::vector<EpisodeStats> test(uint32_t n = 0);

    /** 运行一个 episode (learn = false 时为贪心评估) */
    EpisodeStats run_episode(bool learn);

    /** 尾部 window 个训练 episode 的汇总 (window = 0 → config.stats_window) */
    TrainingSummary summary(size_t window = 0) const;
    void print_summary(size_t window = 0) const;

    /** 请求在下一个 episode 边界停止 (可从其他线程调用) */
    void request_stop() { stop_requested_.store(true); }
    bool stop_requested() const { return stop_requested_.load(); }

    /** 尝试恢复模型 (train() 内部按 load_existing 调用) */
    LoadStatus load_model();
    bool save_model() const;

    void set_callback(EpisodeCallback cb) { callback_ = std::move(cb); }

    const std::vector<EpisodeStats>& episodes() const { return history_; }
    const TrainerConfig& config() const { return config_; }
    uint32_t total_episodes() const { return episode_counter_; }

private:
    Environment&    env_;
    QLearningAgent& agent_;
    TrainerConfig   config_;
    EpisodeCallback callback_;

    std::vector<EpisodeStats> history_;
    uint32_t episode_counter_ = 0;
    bool loaded_ = false;
    std::atomic<bool> stop_requested_{false};
};

} // namespace mazerl
