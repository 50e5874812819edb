#include "engine/maze_env.h"
#include "core/log.h"

namespace mazerl {

const char* outcome_name(MoveOutcome o) {
    switch (o) {
        case MoveOutcome::MOVED:      return "moved";
        case MoveOutcome::COLLISION:  return "collision";
        case MoveOutcome::CHECKPOINT: return "checkpoint";
        case MoveOutcome::GOAL:       return "goal";
        case MoveOutcome::FAULT:      return "fault";
    }
    return "?";
}

const char* termination_name(Termination t) {
    switch (t) {
        case Termination::NONE:              return "none";
        case Termination::GOAL_REACHED:      return "goal_reached";
        case Termination::COLLISION_LIMIT:   return "collision_limit";
        case Termination::STEP_BUDGET:       return "step_budget";
        case Termination::TRANSPORT_TIMEOUT: return "transport_timeout";
        case Termination::INVALID_ACTION:    return "invalid_action";
    }
    return "?";
}

MazeEnvironment::MazeEnvironment(MessageBus& bus, const EnvConfig& cfg)
    : cfg_(cfg)
    , bridge_(bus, cfg.wait)
    , encoder_(cfg.encoder)
    , trace_(cfg.loop_window)
{}

void MazeEnvironment::clear_episode() {
    trace_.clear();
    claimed_.clear();
    last_checkpoint_   = 0;
    checkpoint_reward_ = 0.0;
    steps_      = 0;
    collisions_ = 0;
    streak_     = 0;
    in_loop_    = false;
}

void MazeEnvironment::read_pose() {
    // Absent or malformed pose topics keep the previous value
    if (auto x = bridge_.read_float(topic::X))     pos_x_ = *x;
    if (auto y = bridge_.read_float(topic::Y))     pos_y_ = *y;
    if (auto t = bridge_.read_float(topic::THETA)) theta_ = *t;
}

// =============================================================================
// reset
// =============================================================================

State MazeEnvironment::reset() {
    clear_episode();

    int64_t seq = bridge_.next_sequence();
    bridge_.publish_int(topic::RESET, seq);

    reset_ok_ = bridge_.wait_for_ack(seq, cfg_.wait.reset_timeout_ms);
    if (!reset_ok_) {
        MAZERL_LOG_WARN("reset: no acknowledgement from simulator within %.0f ms",
                        cfg_.wait.reset_timeout_ms);
        return current_;
    }

    read_pose();
    current_ = encoder_.encode(pos_x_, pos_y_, theta_);
    trace_.push(current_);
    MAZERL_LOG_DEBUG("reset: start cell (%d, %d)", current_.x, current_.y);
    return current_;
}

void MazeEnvironment::set_mode(int mode) {
    bridge_.publish_int(topic::MODE, mode);
}

void MazeEnvironment::reset_checkpoints() {
    bridge_.publish_int(topic::RESET_CHECKPOINTS, 1);
}

// =============================================================================
// step
// =============================================================================

StepResult MazeEnvironment::fault_result(Termination reason) {
    StepResult r;
    r.next_state = current_;
    r.reward = 0.0;
    r.done = true;
    r.info.outcome = MoveOutcome::FAULT;
    r.info.reason = reason;
    r.info.fault = true;
    r.info.steps = steps_;
    r.info.streak = streak_;
    r.info.collisions = collisions_;
    r.info.pos_x = pos_x_;
    r.info.pos_y = pos_y_;
    r.info.theta = theta_;
    return r;
}

bool MazeEnvironment::claim_checkpoint(int64_t id, double& bonus) {
    const auto& bonuses = cfg_.rewards.checkpoint_bonuses;
    if (id < 0 || id > static_cast<int64_t>(bonuses.size())) {
        MAZERL_LOG_WARN("checkpoint id %lld outside schedule (1..%zu), ignored",
                        static_cast<long long>(id), bonuses.size());
        return false;
    }
    if (id != last_checkpoint_ + 1) {
        // Already claimed, or reported out of order
        MAZERL_LOG_DEBUG("checkpoint %lld not claimable (next expected %d)",
                         static_cast<long long>(id), last_checkpoint_ + 1);
        return false;
    }

    last_checkpoint_ = static_cast<int>(id);
    claimed_.push_back(last_checkpoint_);
    bonus = bonuses[static_cast<size_t>(id - 1)];
    checkpoint_reward_ += bonus;
    MAZERL_LOG_INFO("CHECKPOINT %d reached, bonus %.1f", last_checkpoint_, bonus);
    return true;
}

StepResult MazeEnvironment::step(Action action) {
    size_t idx = action_index(action);
    if (!is_valid_action_index(static_cast<int64_t>(idx))) {
        MAZERL_LOG_ERROR("invalid action index %zu, nothing published", idx);
        return fault_result(Termination::INVALID_ACTION);
    }

    steps_++;
    int64_t seq = bridge_.next_sequence();
    bridge_.publish_int(topic::ACTION, static_cast<int64_t>(idx));
    bridge_.publish_int(topic::STEP_SEQ, seq);

    if (!bridge_.wait_for_ack(seq, cfg_.wait.step_timeout_ms)) {
        MAZERL_LOG_WARN("step %u (%s): no acknowledgement from simulator within %.0f ms, aborting episode",
                        steps_, action_name(action), cfg_.wait.step_timeout_ms);
        return fault_result(Termination::TRANSPORT_TIMEOUT);
    }

    read_pose();
    bool collision = bridge_.read_flag(topic::COLLISION).value_or(false);
    int64_t checkpoint = bridge_.read_int(topic::CHECKPOINT).value_or(0);
    bool goal = bridge_.read_flag(topic::GOAL).value_or(false);

    State next = encoder_.encode(pos_x_, pos_y_, theta_);

    StepResult r;
    r.next_state = next;
    r.info.outcome = MoveOutcome::MOVED;

    // (a) per-step cost
    double reward = cfg_.rewards.step_cost;

    // (b) collision
    if (collision) {
        reward += cfg_.rewards.collision;
        collisions_++;
        r.info.outcome = MoveOutcome::COLLISION;
    }

    // (c) checkpoint progression
    if (checkpoint != 0) {
        double bonus = 0.0;
        if (claim_checkpoint(checkpoint, bonus)) {
            reward += bonus;
            r.info.checkpoint = static_cast<int>(checkpoint);
            r.info.outcome = MoveOutcome::CHECKPOINT;
        }
    }

    // (d) goal + streak
    if (goal) {
        reward += cfg_.rewards.goal_reached + cfg_.rewards.streak_bonus * streak_;
        r.info.outcome = MoveOutcome::GOAL;
        MAZERL_LOG_DEBUG("goal reached after %u steps (streak %u)", steps_, streak_);
    }

    // (e) loop: penalize entry into a cycle once, re-arm after leaving the window
    if (!collision) {
        bool seen = trace_.contains(next);
        if (seen && !in_loop_) {
            reward += cfg_.rewards.loop_penalty;
            r.info.loop = true;
            in_loop_ = true;
            MAZERL_LOG_DEBUG("loop detected at (%d, %d), penalty %.1f",
                             next.x, next.y, cfg_.rewards.loop_penalty);
        } else if (!seen) {
            in_loop_ = false;
        }
    }

    streak_ = collision ? 0 : streak_ + 1;
    trace_.push(next);
    current_ = next;

    // Termination
    if (goal) {
        r.done = true;
        r.info.reason = Termination::GOAL_REACHED;
        r.info.success = true;
    } else if (cfg_.collision_limit > 0 && collisions_ >= cfg_.collision_limit) {
        r.done = true;
        r.info.reason = Termination::COLLISION_LIMIT;
        MAZERL_LOG_DEBUG("episode ended: collision limit (%u)", cfg_.collision_limit);
    } else if (steps_ >= cfg_.max_steps) {
        r.done = true;
        r.info.reason = Termination::STEP_BUDGET;
        MAZERL_LOG_DEBUG("episode ended: reached maximum steps (%u)", cfg_.max_steps);
    }

    r.reward = reward;
    r.info.steps = steps_;
    r.info.streak = streak_;
    r.info.collisions = collisions_;
    r.info.pos_x = pos_x_;
    r.info.pos_y = pos_y_;
    r.info.theta = theta_;
    return r;
}

} // namespace mazerl
