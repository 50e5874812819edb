#include "agent/q_agent.h"
#include "core/log.h"
#include <algorithm>

namespace mazerl {

QLearningAgent::QLearningAgent(const AgentConfig& config, std::unique_ptr<ExplorationStrategy> strategy)
    : config_(config)
    , strategy_(std::move(strategy))
    , q_table_(config.initial_q)
    , learning_rate_(config.learning_rate)
{
    if (!strategy_) {
        MAZERL_LOG_WARN("no exploration strategy given, using epsilon_greedy defaults");
        strategy_ = make_strategy(StrategyConfig{});
    }
}

Action QLearningAgent::select_action(const State& s) {
    Action a = strategy_->choose(s, q_table_.row(s));
    strategy_->observe(s, a);
    return a;
}

Action QLearningAgent::greedy_action(const State& s) const {
    return argmax_first(q_table_.row(s));
}

double QLearningAgent::update(const State& s, Action a, double reward, const State& next, bool done) {
    // max over s' uses the same first-index tie-break as selection; value is identical either way
    double future = done ? 0.0 : config_.discount_factor * row_max(q_table_.row(next));
    double& q = q_table_.row_mut(s)[action_index(a)];
    double td_error = reward + future - q;
    q += learning_rate_ * td_error;
    return td_error;
}

void QLearningAgent::decay_learning_rate() {
    double next = learning_rate_ * std::min(config_.lr_decay, 1.0);
    if (next < config_.min_learning_rate) next = config_.min_learning_rate;
    learning_rate_ = std::min(learning_rate_, next);
}

ModelBlob QLearningAgent::to_blob() const {
    ModelBlob blob;
    blob.learning_rate = learning_rate_;
    blob.discount = config_.discount_factor;
    blob.initial_q = config_.initial_q;
    blob.strategy = strategy_->snapshot();
    blob.q_table = q_table_;
    blob.history = history_;
    return blob;
}

bool QLearningAgent::save(const std::string& path) const {
    if (!write_model_file(path, to_blob())) return false;
    MAZERL_LOG_DEBUG("model saved to %s (%zu states)", path.c_str(), q_table_.size());
    return true;
}

LoadStatus QLearningAgent::load(const std::string& path) {
    ModelBlob blob;
    LoadStatus st = read_model_file(path, blob);
    if (st != LoadStatus::OK) {
        if (st != LoadStatus::NOT_FOUND) {
            MAZERL_LOG_ERROR("cannot load model %s: %s", path.c_str(), load_status_name(st));
        }
        return st;
    }
    return restore(blob);
}

LoadStatus QLearningAgent::restore(const ModelBlob& blob) {
    if (blob.strategy.kind != strategy_->kind()) {
        MAZERL_LOG_ERROR("model was trained with strategy '%s', agent uses '%s'",
                         strategy_name(blob.strategy.kind), strategy_name(strategy_->kind()));
        return LoadStatus::STRATEGY_MISMATCH;
    }
    if (blob.discount != config_.discount_factor) {
        MAZERL_LOG_WARN("model discount %.4f differs from configured %.4f (keeping configured)",
                        blob.discount, config_.discount_factor);
    }

    q_table_ = blob.q_table;
    learning_rate_ = blob.learning_rate;
    history_ = blob.history;
    strategy_->restore(blob.strategy);

    MAZERL_LOG_INFO("model restored: %zu states, %zu episodes, alpha=%.4f, %s",
                    q_table_.size(), history_.size(), learning_rate_,
                    strategy_->info().c_str());
    return LoadStatus::OK;
}

} // namespace mazerl
