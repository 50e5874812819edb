#include "engine/session.h"
#include "core/log.h"
#include <cmath>

namespace mazerl {

TrainingSession::TrainingSession(const RunConfig& config)
    : config_(config)
{
    if (std::fabs(config_.env.encoder.cell_size - config_.sim.cell_size) > 1e-6f) {
        MAZERL_LOG_WARN("encoder cell_size %.2f != simulator cell_size %.2f",
                        config_.env.encoder.cell_size, config_.sim.cell_size);
    }

    sim_ = std::make_unique<GridSimulator>(bus_, config_.sim);
    if (config_.threaded) {
        sim_->start();
    } else {
        sim_->enable_lockstep();
    }

    env_ = std::make_unique<MazeEnvironment>(bus_, config_.env);
    env_->set_mode(config_.mode);

    agent_ = std::make_unique<QLearningAgent>(config_.agent, make_strategy(config_.strategy));
    trainer_ = std::make_unique<Trainer>(*env_, *agent_, config_.training);

    MAZERL_LOG_DEBUG("session: maze=%s (%zux%zu, shortest path %d), simulator %s",
                     maze_type_name(config_.sim.world.maze_type),
                     sim_->world().width(), sim_->world().height(),
                     sim_->world().shortest_path_length(),
                     config_.threaded ? "threaded" : "lockstep");
}

TrainingSession::~TrainingSession() {
    shutdown();
}

void TrainingSession::shutdown() {
    if (sim_) sim_->stop();
}

} // namespace mazerl
