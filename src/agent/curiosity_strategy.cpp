#include "agent/curiosity_strategy.h"
#include <cmath>
#include <cstdio>

namespace mazerl {

CuriosityStrategy::CuriosityStrategy(const StrategyConfig& cfg)
    : ExplorationStrategy(cfg)
    , epsilon_(cfg.epsilon)
    , novelty_bonus_(cfg.novelty_bonus)
{}

double CuriosityStrategy::novelty(uint32_t visits) const {
    return novelty_bonus_ / std::sqrt(1.0 + static_cast<double>(visits));
}

Action CuriosityStrategy::choose(const State& s, const QRow& q) {
    if (uniform01() < epsilon_) {
        return random_action();
    }

    const auto& counts = visits_.table().row(s);
    QRow effective;
    for (size_t i = 0; i < N_ACTIONS; ++i) {
        effective[i] = q[i] + novelty(counts[i]);
    }
    return argmax_first(effective);
}

void CuriosityStrategy::decay() {
    epsilon_ = decayed_epsilon(epsilon_, config_.epsilon_decay, config_.min_epsilon);
}

std::string CuriosityStrategy::info() const {
    char buf[160];
    snprintf(buf, sizeof(buf), "curiosity eps=%.4f novelty_bonus=%.2f states_discovered=%zu",
             epsilon_, novelty_bonus_, visits_.n_states());
    return std::string(buf);
}

void CuriosityStrategy::fill_params(StrategyState& st) const {
    st.epsilon = epsilon_;
    st.novelty_bonus = novelty_bonus_;
}

void CuriosityStrategy::apply_params(const StrategyState& st) {
    epsilon_ = st.epsilon;
    novelty_bonus_ = st.novelty_bonus;
}

} // namespace mazerl
