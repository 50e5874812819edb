#include "engine/trainer.h"
#include "core/log.h"
#include <algorithm>

namespace mazerl {

Trainer::Trainer(Environment& env, QLearningAgent& agent, const TrainerConfig& config)
    : env_(env)
    , agent_(agent)
    , config_(config)
{}

// =============================================================================
// Persistence
// =============================================================================

LoadStatus Trainer::load_model() {
    LoadStatus st = agent_.load(config_.model_path);
    if (st == LoadStatus::OK) {
        episode_counter_ = static_cast<uint32_t>(agent_.history().size());
    } else if (st == LoadStatus::NOT_FOUND) {
        MAZERL_LOG_INFO("No saved model at %s, starting fresh", config_.model_path.c_str());
    }
    return st;
}

bool Trainer::save_model() const {
    if (!config_.save_model) return true;
    if (!agent_.save(config_.model_path)) {
        MAZERL_LOG_ERROR("Failed to save model to %s", config_.model_path.c_str());
        return false;
    }
    MAZERL_LOG_DEBUG("model saved to %s", config_.model_path.c_str());
    return true;
}

// =============================================================================
// Episode
// =============================================================================

EpisodeStats Trainer::run_episode(bool learn) {
    EpisodeStats stats;
    stats.learned = learn;
    stats.epsilon = agent_.strategy().epsilon();
    stats.learning_rate = agent_.learning_rate();

    State s = env_.reset();
    if (!env_.last_reset_ok()) {
        stats.fault = true;
        stats.reason = Termination::TRANSPORT_TIMEOUT;
        return stats;
    }

    bool done = false;
    while (!done) {
        Action a = learn ? agent_.select_action(s) : agent_.greedy_action(s);
        StepResult r = env_.step(a);

        if (r.info.fault) {
            // No correlated reply: the transition is unknown, do not learn from it
            stats.fault = true;
            stats.reason = r.info.reason;
            stats.steps = r.info.steps;
            stats.collisions = r.info.collisions;
            break;
        }

        if (learn) {
            agent_.update(s, a, r.reward, r.next_state, r.done);
        }

        stats.total_reward += r.reward;
        stats.steps = r.info.steps;
        stats.collisions = r.info.collisions;
        stats.max_streak = std::max(stats.max_streak, r.info.streak);
        if (r.info.checkpoint != 0) stats.checkpoints++;
        if (r.done) {
            stats.reason = r.info.reason;
            stats.success = r.info.success;
        }

        s = r.next_state;
        done = r.done;
    }
    return stats;
}

// =============================================================================
// Train
// =============================================================================

bool Trainer::train(uint32_t n) {
    if (n == 0) n = config_.episodes;
    stop_requested_.store(false);

    if (config_.load_existing && !loaded_) {
        LoadStatus st = load_model();
        if (st != LoadStatus::OK && st != LoadStatus::NOT_FOUND) {
            return false;
        }
        loaded_ = true;
    }

    MAZERL_LOG_INFO("Starting training for %u episodes", n);
    MAZERL_LOG_INFO("Strategy: %s", agent_.strategy().info().c_str());

    bool ok = true;
    for (uint32_t ep = 0; ep < n; ++ep) {
        if (stop_requested_.load()) {
            MAZERL_LOG_INFO("Training stopped by request after %u episodes", ep);
            break;
        }

        EpisodeStats stats = run_episode(true);
        stats.episode = ++episode_counter_;
        if (stats.reason == Termination::INVALID_ACTION) {
            MAZERL_LOG_ERROR("Episode %u/%u: agent produced an action outside the action set, training stopped",
                             ep + 1, n);
            ok = false;
            break;
        }

        agent_.strategy().decay();
        agent_.decay_learning_rate();

        EpisodeRecord rec;
        rec.reward = stats.total_reward;
        rec.steps = stats.steps;
        rec.success = stats.success;
        agent_.record_episode(rec);
        history_.push_back(stats);

        if (stats.fault) {
            MAZERL_LOG_WARN("Episode %u/%u FAULT: %s after %u steps",
                            ep + 1, n, termination_name(stats.reason), stats.steps);
        } else {
            MAZERL_LOG_INFO("Episode %u/%u %s: Reward: %.1f, Steps: %u, Max streak: %u, %s",
                            ep + 1, n, stats.success ? "GOAL" : "FAIL",
                            stats.total_reward, stats.steps, stats.max_streak,
                            termination_name(stats.reason));
        }

        if (callback_) callback_(stats);

        if (config_.save_every > 0 && (ep + 1) % config_.save_every == 0) {
            if (!save_model()) ok = false;
            if (log_enabled(LogLevel::DEBUG)) print_summary();
        }
    }

    if (!save_model()) ok = false;
    MAZERL_LOG_INFO("Training completed!");
    print_summary();
    return ok;
}

// =============================================================================
// Test
// =============================================================================

std::vector<EpisodeStats> Trainer::test(uint32_t n) {
    if (n == 0) n = config_.test_episodes;
    MAZERL_LOG_INFO("Testing agent for %u episodes", n);

    std::vector<EpisodeStats> results;
    uint32_t successes = 0;
    uint64_t total_steps = 0;

    for (uint32_t ep = 0; ep < n; ++ep) {
        EpisodeStats stats = run_episode(false);
        stats.episode = ep + 1;
        if (stats.reason == Termination::INVALID_ACTION) {
            MAZERL_LOG_ERROR("Test %u/%u: agent produced an action outside the action set, testing stopped",
                             ep + 1, n);
            break;
        }
        total_steps += stats.steps;

        if (stats.success) {
            successes++;
            MAZERL_LOG_INFO("Test %u/%u: goal reached in %u steps", ep + 1, n, stats.steps);
        } else {
            MAZERL_LOG_INFO("Test %u/%u failed: %s", ep + 1, n, termination_name(stats.reason));
        }
        results.push_back(stats);
    }

    uint32_t ran = static_cast<uint32_t>(results.size());
    if (ran > 0) {
        MAZERL_LOG_INFO("Success rate: %u/%u (%.1f%%), average steps: %.1f",
                        successes, ran, 100.0 * successes / ran,
                        static_cast<double>(total_steps) / ran);
    }
    return results;
}

// =============================================================================
// Summary
// =============================================================================

TrainingSummary Trainer::summary(size_t window) const {
    if (window == 0) window = config_.stats_window;
    const auto& hist = agent_.history();

    TrainingSummary sum;
    sum.total_episodes = hist.size();
    sum.states_explored = agent_.states_explored();
    if (hist.empty()) return sum;

    for (size_t i = 0; i < hist.size(); ++i) {
        if (sum.best_episode < 0 || hist[i].reward > sum.best_reward) {
            sum.best_reward = hist[i].reward;
            sum.best_episode = static_cast<int>(i) + 1;
        }
    }

    size_t start = hist.size() > window ? hist.size() - window : 0;
    size_t successes = 0;
    for (size_t i = start; i < hist.size(); ++i) {
        sum.mean_reward += hist[i].reward;
        sum.mean_steps  += hist[i].steps;
        if (hist[i].success) successes++;
    }
    sum.episodes = hist.size() - start;
    sum.mean_reward /= sum.episodes;
    sum.mean_steps  /= sum.episodes;
    sum.success_rate = static_cast<double>(successes) / sum.episodes;
    return sum;
}

void Trainer::print_summary(size_t window) const {
    TrainingSummary s = summary(window);
    MAZERL_LOG_INFO("Statistics (last %zu of %zu episodes):", s.episodes, s.total_episodes);
    MAZERL_LOG_INFO("  Average reward:  %.2f", s.mean_reward);
    MAZERL_LOG_INFO("  Average steps:   %.1f", s.mean_steps);
    MAZERL_LOG_INFO("  Success rate:    %.1f%%", 100.0 * s.success_rate);
    MAZERL_LOG_INFO("  States explored: %zu", s.states_explored);
    if (s.best_episode > 0) {
        MAZERL_LOG_INFO("  Best reward:     %.1f (episode %d)", s.best_reward, s.best_episode);
    }
}

} // namespace mazerl
