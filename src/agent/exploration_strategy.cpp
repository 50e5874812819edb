#include "agent/exploration_strategy.h"
#include "agent/epsilon_greedy.h"
#include "agent/ucb_strategy.h"
#include "agent/curiosity_strategy.h"
#include <algorithm>
#include <cstdio>

namespace mazerl {

const char* strategy_name(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::EPSILON_GREEDY: return "epsilon_greedy";
        case StrategyKind::UCB:            return "ucb";
        case StrategyKind::CURIOSITY:      return "curiosity";
    }
    return "unknown";
}

bool parse_strategy_kind(const std::string& name, StrategyKind& out) {
    if (name == "epsilon_greedy" || name == "epsilon") { out = StrategyKind::EPSILON_GREEDY; return true; }
    if (name == "ucb")                                 { out = StrategyKind::UCB;            return true; }
    if (name == "curiosity")                           { out = StrategyKind::CURIOSITY;      return true; }
    return false;
}

uint32_t VisitCounts::total(const State& s) const {
    uint32_t n = 0;
    for (auto c : table_.row(s)) n += c;
    return n;
}

// =============================================================================
// ExplorationStrategy base
// =============================================================================

ExplorationStrategy::ExplorationStrategy(const StrategyConfig& cfg)
    : config_(cfg)
    , rng_(cfg.seed)
{}

double ExplorationStrategy::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

Action ExplorationStrategy::random_action() {
    std::uniform_int_distribution<size_t> dist(0, N_ACTIONS - 1);
    return action_from_index(dist(rng_));
}

std::string ExplorationStrategy::info() const {
    char buf[128];
    snprintf(buf, sizeof(buf), "%s states_discovered=%zu",
             strategy_name(kind()), visits_.n_states());
    return std::string(buf);
}

StrategyState ExplorationStrategy::snapshot() const {
    StrategyState st;
    st.kind = kind();
    st.epsilon = config_.epsilon;
    st.ucb_c = config_.ucb_c;
    st.novelty_bonus = config_.novelty_bonus;
    fill_params(st);
    st.visits = visits_;
    return st;
}

void ExplorationStrategy::restore(const StrategyState& st) {
    apply_params(st);
    visits_ = st.visits;
}

double decayed_epsilon(double epsilon, double decay, double floor) {
    double next = epsilon * std::min(decay, 1.0);
    if (next < floor) next = floor;
    return std::min(epsilon, next);
}

std::unique_ptr<ExplorationStrategy> make_strategy(const StrategyConfig& cfg) {
    switch (cfg.kind) {
        case StrategyKind::EPSILON_GREEDY: return std::make_unique<EpsilonGreedyStrategy>(cfg);
        case StrategyKind::UCB:            return std::make_unique<UcbStrategy>(cfg);
        case StrategyKind::CURIOSITY:      return std::make_unique<CuriosityStrategy>(cfg);
    }
    return nullptr;
}

} // namespace mazerl
