#pragma once
/**
 * QLearningAgent — 表格 Q-learning
 *
 * 持有 Q 表与更新规则, 动作选择委托给 ExplorationStrategy:
 *
 *   select_action(s)  → strategy.choose(s, Q(s,·)), 然后 strategy.observe(s, a)
 *   greedy_action(s)  → argmax Q(s,·) (测试模式, 无探索, 不计数)
 *   update(s,a,r,s',done):
 *       Q(s,a) ← Q(s,a) + α · [ r + γ · max_a' Q(s',a') · (1 − done) − Q(s,a) ]
 *       done 时不自举 (episode 边界之后没有未来回报)
 *
 * 学习率 α 每 episode 乘法衰减到下限, 与 epsilon 衰减相互独立。
 *
 * Q 表与策略计数只在单一控制线程上由本类修改, 无需加锁。
 */

#include "core/types.h"
#include "core/state_table.h"
#include "agent/exploration_strategy.h"
#include "agent/model_io.h"
#include <memory>
#include <string>
#include <vector>

namespace mazerl {

struct AgentConfig {
    double learning_rate     = 0.12;
    double min_learning_rate = 0.02;
    double lr_decay          = 0.997;   // 每 episode
    double discount_factor   = 0.96;
    double initial_q         = 0.0;     // 未访问 (s,a) 的默认值 (>0 = 乐观初始化)
};

class QLearningAgent {
public:
    QLearningAgent(const AgentConfig& config, std::unique_ptr<ExplorationStrategy> strategy);

    QLearningAgent(const QLearningAgent&) = delete;
    QLearningAgent& operator=(const QLearningAgent&) = delete;

    // --- 决策 ---
    Action select_action(const State& s);
    Action greedy_action(const State& s) const;

    // --- 学习 ---
    /** 应用一次 Q 更新, 返回 TD 误差 */
    double update(const State& s, Action a, double reward, const State& next, bool done);

    /** α ← max(α_min, α · lr_decay), 单调不增 */
    void decay_learning_rate();

    // --- 查询 ---
    double q_value(const State& s, Action a) const { return q_table_.get(s, a); }
    const QRow& q_values(const State& s) const { return q_table_.row(s); }
    const StateTable<double>& q_table() const { return q_table_; }
    size_t states_explored() const { return q_table_.size(); }

    double learning_rate() const { return learning_rate_; }
    double discount() const { return config_.discount_factor; }
    const AgentConfig& config() const { return config_; }

    ExplorationStrategy&       strategy()       { return *strategy_; }
    const ExplorationStrategy& strategy() const { return *strategy_; }

    // --- episode 历史 (随模型持久化) ---
    void record_episode(const EpisodeRecord& rec) { history_.push_back(rec); }
    const std::vector<EpisodeRecord>& history() const { return history_; }

    // --- 持久化 ---
    ModelBlob to_blob() const;
    bool save(const std::string& path) const;

    /**
     * 从文件恢复 Q 表/计数/策略参数/α。
     * 任何非 OK 状态都不修改 agent (不会部分恢复)。
     */
    LoadStatus load(const std::string& path);
    LoadStatus restore(const ModelBlob& blob);

private:
    AgentConfig config_;
    std::unique_ptr<ExplorationStrategy> strategy_;
    StateTable<double> q_table_;
    double learning_rate_;
    std::vector<EpisodeRecord> history_;
};

} // namespace mazerl
