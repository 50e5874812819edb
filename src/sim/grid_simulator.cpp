#include "sim/grid_simulator.h"
#include "core/log.h"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace mazerl {

namespace {

constexpr double PI = 3.14159265358979323846;

// RIGHT = 0, UP = π/2, LEFT = π, DOWN = -π/2
double heading_of(Action a) {
    switch (a) {
        case Action::UP:    return PI / 2.0;
        case Action::DOWN:  return -PI / 2.0;
        case Action::LEFT:  return PI;
        case Action::RIGHT: return 0.0;
    }
    return 0.0;
}

} // anonymous namespace

GridSimulator::GridSimulator(LastValueBus& bus, const SimConfig& config)
    : bus_(bus)
    , config_(config)
    , world_(config.world)
    , rng_(config.seed)
{
    // Jitter above half a cell would move the pose into a neighbouring cell
    float max_jitter = 0.49f * config_.cell_size;
    if (config_.pose_jitter > max_jitter) {
        MAZERL_LOG_WARN("pose_jitter %.2f clamped to %.2f", config_.pose_jitter, max_jitter);
        config_.pose_jitter = max_jitter;
    }
    if (config_.frames_per_move == 0) config_.frames_per_move = 1;
}

GridSimulator::~GridSimulator() {
    stop();
    if (lockstep_) bus_.set_publish_hook(nullptr);
}

// =============================================================================
// Lockstep
// =============================================================================

void GridSimulator::enable_lockstep() {
    if (running_.load()) {
        MAZERL_LOG_WARN("simulator thread is running, lockstep not enabled");
        return;
    }
    lockstep_ = true;
    bus_.set_publish_hook([this](const std::string& t, const BusValue& v) {
        on_publish(t, v);
    });
}

void GridSimulator::on_publish(const std::string& t, const BusValue& v) {
    // Only agent → simulator topics; our own publications pass through here too
    if (t == topic::STEP_SEQ) {
        std::lock_guard<std::mutex> lock(sim_mu_);
        last_step_seq_ = v.i;
        handle_step(v.i);
    } else if (t == topic::RESET) {
        std::lock_guard<std::mutex> lock(sim_mu_);
        last_reset_ = v.i;
        handle_reset(v.i);
    } else if (t == topic::RESET_CHECKPOINTS) {
        std::lock_guard<std::mutex> lock(sim_mu_);
        last_cp_reset_ = v.i;
        world_.reset_checkpoints();
    } else if (t == topic::MODE) {
        std::lock_guard<std::mutex> lock(sim_mu_);
        mode_ = static_cast<int>(v.as_double());
    }
}

// =============================================================================
// Threaded
// =============================================================================

bool GridSimulator::start() {
    if (lockstep_) {
        MAZERL_LOG_ERROR("simulator already runs in lockstep mode");
        return false;
    }
    if (running_.load()) return true;

    {
        std::lock_guard<std::mutex> lock(sim_mu_);
        // Commands already on the bus predate this simulator
        if (auto v = bus_.read(topic::STEP_SEQ))          last_step_seq_ = v->i;
        if (auto v = bus_.read(topic::RESET))             last_reset_    = v->i;
        if (auto v = bus_.read(topic::RESET_CHECKPOINTS)) last_cp_reset_ = v->i;
    }

    running_.store(true);
    thread_ = std::thread(&GridSimulator::run_loop, this);
    MAZERL_LOG_DEBUG("simulator thread started (frame %.1f ms)", config_.frame_ms);
    return true;
}

void GridSimulator::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    MAZERL_LOG_DEBUG("simulator thread stopped after %llu frames",
                     static_cast<unsigned long long>(frames_));
}

void GridSimulator::run_loop() {
    using Clock = std::chrono::steady_clock;
    auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(config_.frame_ms));
    auto next = Clock::now();

    while (running_.load()) {
        frame();
        next += period;
        auto now = Clock::now();
        if (next > now) {
            std::this_thread::sleep_until(next);
        } else {
            next = now;   // overrun: do not try to catch up
        }
    }
}

void GridSimulator::frame() {
    std::lock_guard<std::mutex> lock(sim_mu_);
    frames_++;
    bus_.publish_float(topic::TICK, config_.frame_ms / 1000.0);   // frame delta (s)

    if (auto v = bus_.read(topic::MODE)) mode_ = static_cast<int>(v->as_double());

    if (auto v = bus_.read(topic::RESET_CHECKPOINTS)) {
        if (v->i != last_cp_reset_) {
            last_cp_reset_ = v->i;
            world_.reset_checkpoints();
        }
    }

    if (auto v = bus_.read(topic::RESET)) {
        if (v->i != last_reset_) {
            last_reset_ = v->i;
            pending_.active = false;
            // Steps issued before the reset are abandoned
            if (auto st = bus_.read(topic::STEP_SEQ)) last_step_seq_ = st->i;
            handle_reset(v->i);
            return;
        }
    }

    if (pending_.active) {
        advance_pending();
    }

    if (auto v = bus_.read(topic::STEP_SEQ)) {
        if (v->i != last_step_seq_) {
            last_step_seq_ = v->i;
            if (pending_.active) {
                // Agent gave up on the previous move
                finish_move(pending_.seq, pending_.result);
                pending_.active = false;
            }
            handle_step(v->i);
        }
    }
}

// =============================================================================
// Command handling (sim_mu_ held)
// =============================================================================

double GridSimulator::jitter() {
    if (config_.pose_jitter <= 0.0f) return 0.0;
    std::uniform_real_distribution<double> d(-config_.pose_jitter, config_.pose_jitter);
    return d(rng_);
}

void GridSimulator::publish_xy(double x, double y) {
    bus_.publish_float(topic::X, x + jitter());
    bus_.publish_float(topic::Y, y + jitter());
    bus_.publish_float(topic::THETA, theta_);
    if (config_.publish_z) bus_.publish_float(topic::Z, 0.0);
}

void GridSimulator::publish_pose() {
    std::lock_guard<std::mutex> lock(sim_mu_);
    publish_xy(world_.agent_x() * config_.cell_size, world_.agent_y() * config_.cell_size);
    bus_.publish_int(topic::COLLISION, 0);
    bus_.publish_int(topic::CHECKPOINT, 0);
    bus_.publish_int(topic::GOAL, 0);
}

void GridSimulator::handle_reset(int64_t seq) {
    world_.reset();
    theta_ = 0.0;
    commands_++;

    publish_xy(world_.agent_x() * config_.cell_size, world_.agent_y() * config_.cell_size);
    bus_.publish_int(topic::COLLISION, 0);
    bus_.publish_int(topic::CHECKPOINT, 0);
    bus_.publish_int(topic::GOAL, 0);
    bus_.publish_int(topic::ACK_SEQ, seq);
}

void GridSimulator::handle_step(int64_t seq) {
    commands_++;

    auto a = bus_.read(topic::ACTION);
    int64_t ai = a ? static_cast<int64_t>(a->as_double()) : -1;
    if (!is_valid_action_index(ai)) {
        MAZERL_LOG_WARN("simulator: invalid action %lld, no move",
                        static_cast<long long>(ai));
        MoveResult none;
        none.x = world_.agent_x();
        none.y = world_.agent_y();
        finish_move(seq, none);
        return;
    }

    Action action = action_from_index(static_cast<size_t>(ai));
    double from_x = world_.agent_x() * config_.cell_size;
    double from_y = world_.agent_y() * config_.cell_size;
    MoveResult r = world_.act(action);
    if (!r.collision) theta_ = heading_of(action);

    bool interpolate = !lockstep_ && mode_ == 1 && config_.frames_per_move > 1 && !r.collision;
    if (!interpolate) {
        finish_move(seq, r);
        return;
    }

    pending_.active      = true;
    pending_.seq         = seq;
    pending_.result      = r;
    pending_.from_x      = from_x;
    pending_.from_y      = from_y;
    pending_.frames_left = config_.frames_per_move;
}

void GridSimulator::advance_pending() {
    pending_.frames_left--;
    if (pending_.frames_left == 0) {
        finish_move(pending_.seq, pending_.result);
        pending_.active = false;
        return;
    }
    double t = 1.0 - static_cast<double>(pending_.frames_left) / config_.frames_per_move;
    double to_x = pending_.result.x * config_.cell_size;
    double to_y = pending_.result.y * config_.cell_size;
    publish_xy(pending_.from_x + (to_x - pending_.from_x) * t,
               pending_.from_y + (to_y - pending_.from_y) * t);
}

void GridSimulator::finish_move(int64_t seq, const MoveResult& r) {
    publish_xy(r.x * config_.cell_size, r.y * config_.cell_size);
    bus_.publish_int(topic::COLLISION, r.collision ? 1 : 0);
    bus_.publish_int(topic::CHECKPOINT, r.checkpoint);
    bus_.publish_int(topic::GOAL, r.goal ? 1 : 0);
    bus_.publish_int(topic::ACK_SEQ, seq);
}

} // namespace mazerl
