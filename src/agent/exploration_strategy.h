#pragma once
/**
 * ExplorationStrategy — 可插拔探索策略
 *
 * 封闭集合 {EPSILON_GREEDY, UCB, CURIOSITY}, 启动时按配置选定一次,
 * 整个训练过程持有单个多态实例 (std::unique_ptr<ExplorationStrategy>)。
 *
 * 公共契约:
 *   choose(state, q_row) → action   只读, 不修改计数
 *   observe(state, action)          Agent 提交选择后调用, 计数的唯一修改者
 *   decay()                         每 episode 一次, epsilon 的唯一修改者
 *
 * 访问计数 (State, Action) 与每状态总数:
 *   每次决策恰好 +1, 从不递减, 跨 episode 保留; 仅 reset_counts() 清零。
 */

#include "core/types.h"
#include "core/state_table.h"
#include <cstdint>
#include <memory>
#include <random>
#include <string>

namespace mazerl {

enum class StrategyKind : uint8_t {
    EPSILON_GREEDY = 0,
    UCB            = 1,
    CURIOSITY      = 2
};

const char* strategy_name(StrategyKind kind);

/** "epsilon_greedy"/"ucb"/"curiosity" → kind, 未知名称返回 false */
bool parse_strategy_kind(const std::string& name, StrategyKind& out);

struct StrategyConfig {
    StrategyKind kind = StrategyKind::CURIOSITY;

    // epsilon-greedy / curiosity 主干
    double epsilon       = 0.3;
    double epsilon_decay = 0.995;   // 每 episode 乘法衰减 (1.0 = 不衰减)
    double min_epsilon   = 0.01;

    // UCB 置信系数
    double ucb_c = 2.0;

    // Curiosity 新奇度奖励 (仅用于选择, 不写入 Q 表)
    double novelty_bonus = 8.0;

    uint32_t seed = 42;
};

/** (State, Action) 访问计数 */
class VisitCounts {
public:
    void record(const State& s, Action a) { table_.row_mut(s)[action_index(a)]++; }

    uint32_t count(const State& s, Action a) const { return table_.get(s, a); }
    uint32_t total(const State& s) const;

    size_t n_states() const { return table_.size(); }
    void   clear() { table_.clear(); }

    const StateTable<uint32_t>& table() const { return table_; }
    StateTable<uint32_t>&       table()       { return table_; }

    bool operator==(const VisitCounts& o) const { return table_ == o.table_; }

private:
    StateTable<uint32_t> table_{0u};
};

/** 策略的全部可持久化数值状态 */
struct StrategyState {
    StrategyKind kind   = StrategyKind::CURIOSITY;
    double epsilon       = 0.0;
    double ucb_c         = 0.0;
    double novelty_bonus = 0.0;
    VisitCounts visits;
};

class ExplorationStrategy {
public:
    explicit ExplorationStrategy(const StrategyConfig& cfg);
    virtual ~ExplorationStrategy() = default;

    virtual StrategyKind kind() const = 0;

    /** 给定状态与该状态各动作 Q 值, 选择动作 */
    virtual Action choose(const State& s, const QRow& q) = 0;

    /** 提交选择: 计数 +1 */
    void observe(const State& s, Action a) { visits_.record(s, a); }

    /** episode 结束时调用 (默认无参数可衰减) */
    virtual void decay() {}

    /** 当前探索率 (UCB 无 epsilon, 返回 0) */
    virtual double epsilon() const { return 0.0; }

    /** 一行摘要 (日志用) */
    virtual std::string info() const;

    const VisitCounts& visits() const { return visits_; }
    const StrategyConfig& config() const { return config_; }

    /** 操作员显式清零访问计数 */
    void reset_counts() { visits_.clear(); }

    // --- 持久化 ---
    StrategyState snapshot() const;
    void restore(const StrategyState& st);

protected:
    StrategyConfig config_;
    VisitCounts    visits_;
    std::mt19937   rng_;

    double uniform01();
    Action random_action();

    /** 子类参数快照/恢复 (epsilon, c, bonus) */
    virtual void fill_params(StrategyState& st) const = 0;
    virtual void apply_params(const StrategyState& st) = 0;
};

/** epsilon 单调不增衰减: max(floor, eps*decay), 但绝不升高 */
double decayed_epsilon(double epsilon, double decay, double floor);

std::unique_ptr<ExplorationStrategy> make_strategy(const StrategyConfig& cfg);

} // namespace mazerl
