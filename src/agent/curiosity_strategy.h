#pragma once
/**
 * CuriosityStrategy — 新奇度驱动探索
 *
 * 以 epsilon-greedy 为主干:
 *   概率 epsilon: 均匀随机动作
 *   否则: argmax [ Q(s,a) + novelty(n(s,a)) ]
 *
 *   novelty(n) = novelty_bonus / sqrt(1 + n)
 *
 * 新奇度只影响本次选择, 从不写入 Q 表。
 * n → ∞ 时 novelty → 0, 策略收敛到普通 epsilon-greedy。
 * epsilon_decay < 1 时基础 epsilon 仍按 episode 衰减。
 */

#include "agent/exploration_strategy.h"

namespace mazerl {

class CuriosityStrategy : public ExplorationStrategy {
public:
    explicit CuriosityStrategy(const StrategyConfig& cfg);

    StrategyKind kind() const override { return StrategyKind::CURIOSITY; }
    Action choose(const State& s, const QRow& q) override;
    void decay() override;
    double epsilon() const override { return epsilon_; }
    std::string info() const override;

    /** 访问 n 次后的新奇度奖励 (严格单调递减) */
    double novelty(uint32_t visits) const;

    double novelty_bonus() const { return novelty_bonus_; }

protected:
    void fill_params(StrategyState& st) const override;
    void apply_params(const StrategyState& st) override;

private:
    double epsilon_;
    double novelty_bonus_;
};

} // namespace mazerl
