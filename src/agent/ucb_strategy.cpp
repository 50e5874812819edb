#include "agent/ucb_strategy.h"
#include <cmath>
#include <cstdio>

namespace mazerl {

UcbStrategy::UcbStrategy(const StrategyConfig& cfg)
    : ExplorationStrategy(cfg)
    , c_(cfg.ucb_c)
{}

double UcbStrategy::score(double q, uint32_t state_total, uint32_t action_visits) const {
    double bonus = std::sqrt(std::log(static_cast<double>(state_total) + 1.0)
                             / (static_cast<double>(action_visits) + 1.0));
    return q + c_ * bonus;
}

Action UcbStrategy::choose(const State& s, const QRow& q) {
    const auto& counts = visits_.table().row(s);

    // Untried actions first (enumeration order)
    for (size_t i = 0; i < N_ACTIONS; ++i) {
        if (counts[i] == 0) return action_from_index(i);
    }

    uint32_t total = visits_.total(s);
    QRow scores;
    for (size_t i = 0; i < N_ACTIONS; ++i) {
        scores[i] = score(q[i], total, counts[i]);
    }
    return argmax_first(scores);
}

std::string UcbStrategy::info() const {
    char buf[128];
    snprintf(buf, sizeof(buf), "ucb c=%.3f states_discovered=%zu",
             c_, visits_.n_states());
    return std::string(buf);
}

void UcbStrategy::fill_params(StrategyState& st) const {
    st.ucb_c = c_;
    st.epsilon = 0.0;
}

void UcbStrategy::apply_params(const StrategyState& st) {
    c_ = st.ucb_c;
}

} // namespace mazerl
