#pragma once
/**
 * TrainingSession — 完整的进程内训练闭环
 *
 *   Trainer ──select/update──▶ QLearningAgent ──choose──▶ ExplorationStrategy
 *      │
 *      └─reset/step──▶ MazeEnvironment ──publish/read──▶ LastValueBus ◀──▶ GridSimulator
 *
 * 按 RunConfig 构建所有组件并连接; 模拟器以 lockstep 或 threaded 方式运行。
 * 工具 (mazerl_train, benchmark_strategies) 和 Python 绑定都通过本类驱动训练。
 *
 * 日志级别是进程级设置, 由调用方负责 (本类不修改)。
 */

#include "engine/run_config.h"
#include "engine/maze_env.h"
#include "engine/trainer.h"
#include "agent/q_agent.h"
#include "sim/grid_simulator.h"
#include "core/message_bus.h"
#include <memory>

namespace mazerl {

class TrainingSession {
public:
    explicit TrainingSession(const RunConfig& config = {});
    ~TrainingSession();

    // Non-copyable, non-movable (components hold references to each other)
    TrainingSession(const TrainingSession&) = delete;
    TrainingSession& operator=(const TrainingSession&) = delete;
    TrainingSession(TrainingSession&&) = delete;
    TrainingSession& operator=(TrainingSession&&) = delete;

    bool train(uint32_t n = 0) { return trainer_->train(n); }
    std::vector<EpisodeStats> test(uint32_t n = 0) { return trainer_->test(n); }
    LoadStatus load() { return trainer_->load_model(); }
    bool save() const { return trainer_->save_model(); }
    TrainingSummary summary(size_t window = 0) const { return trainer_->summary(window); }

    /** 停止模拟器线程 (threaded 模式; 析构时自动调用) */
    void shutdown();

    // --- 访问器 ---
    const RunConfig&  config()    const { return config_; }
    LastValueBus&     bus()             { return bus_; }
    GridSimulator&    simulator()       { return *sim_; }
    MazeEnvironment&  env()             { return *env_; }
    QLearningAgent&   agent()           { return *agent_; }
    Trainer&          trainer()         { return *trainer_; }

private:
    RunConfig config_;

    // Declaration order = construction order; the simulator is torn down
    // before the bus it is hooked into
    LastValueBus                     bus_;
    std::unique_ptr<GridSimulator>   sim_;
    std::unique_ptr<MazeEnvironment> env_;
    std::unique_ptr<QLearningAgent>  agent_;
    std::unique_ptr<Trainer>         trainer_;
};

} // namespace mazerl
