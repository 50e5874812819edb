#pragma once
/**
 * UcbStrategy — 上置信界探索
 *
 *   score(a) = Q(s,a) + c · sqrt( ln(N(s) + 1) / (n(s,a) + 1) )
 *
 * 该状态下尚未尝试过的动作 (n(s,a) = 0) 总是优先于任何已尝试动作,
 * 多个未尝试动作时取枚举顺序第一个 → 保证每个状态的初始全覆盖。
 * 无 epsilon, decay() 不改变任何参数。
 */

#include "agent/exploration_strategy.h"

namespace mazerl {

class UcbStrategy : public ExplorationStrategy {
public:
    explicit UcbStrategy(const StrategyConfig& cfg);

    StrategyKind kind() const override { return StrategyKind::UCB; }
    Action choose(const State& s, const QRow& q) override;
    std::string info() const override;

    /** 单个动作的 UCB 分数 (测试/诊断用) */
    double score(double q, uint32_t state_total, uint32_t action_visits) const;

    double c() const { return c_; }

protected:
    void fill_params(StrategyState& st) const override;
    void apply_params(const StrategyState& st) override;

private:
    double c_;
};

} // namespace mazerl
