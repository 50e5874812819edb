#include "agent/epsilon_greedy.h"
#include <cstdio>

namespace mazerl {

EpsilonGreedyStrategy::EpsilonGreedyStrategy(const StrategyConfig& cfg)
    : ExplorationStrategy(cfg)
    , epsilon_(cfg.epsilon)
{}

Action EpsilonGreedyStrategy::choose(const State& /* s */, const QRow& q) {
    if (uniform01() < epsilon_) {
        return random_action();
    }
    return argmax_first(q);
}

void EpsilonGreedyStrategy::decay() {
    epsilon_ = decayed_epsilon(epsilon_, config_.epsilon_decay, config_.min_epsilon);
}

std::string EpsilonGreedyStrategy::info() const {
    char buf[128];
    snprintf(buf, sizeof(buf), "epsilon_greedy eps=%.4f states_discovered=%zu",
             epsilon_, visits_.n_states());
    return std::string(buf);
}

void EpsilonGreedyStrategy::fill_params(StrategyState& st) const {
    st.epsilon = epsilon_;
}

void EpsilonGreedyStrategy::apply_params(const StrategyState& st) {
    epsilon_ = st.epsilon;
}

} // namespace mazerl
