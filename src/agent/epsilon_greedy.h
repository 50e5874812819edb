#pragma once
/**
 * EpsilonGreedyStrategy
 *
 *   概率 epsilon: 均匀随机动作
 *   否则:         argmax Q(s,·), 平局取枚举顺序第一个
 *   decay():      epsilon ← max(min_epsilon, epsilon × epsilon_decay)
 */

#include "agent/exploration_strategy.h"

namespace mazerl {

class EpsilonGreedyStrategy : public ExplorationStrategy {
public:
    explicit EpsilonGreedyStrategy(const StrategyConfig& cfg);

    StrategyKind kind() const override { return StrategyKind::EPSILON_GREEDY; }
    Action choose(const State& s, const QRow& q) override;
    void decay() override;
    double epsilon() const override { return epsilon_; }
    std::string info() const override;

protected:
    void fill_params(StrategyState& st) const override;
    void apply_params(const StrategyState& st) override;

private:
    double epsilon_;
};

} // namespace mazerl
