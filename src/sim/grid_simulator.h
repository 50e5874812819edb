#pragma once
/**
 * GridSimulator — 进程内参考模拟器
 *
 * 站在总线的另一端扮演外部物理模拟器, 只通过 topic 与训练循环交互:
 *
 *   订阅: Action, step_seq, reset, mode, reset_checkpoints
 *   发布: X, Y, Theta, [Z], Collision, checkpoint_reached, GoalReached, tick
 *         ack_seq (最后发布, 保证 ack 可见时本步所有结果都已可见)
 *
 * 两种运行方式 (二选一):
 *   - lockstep: enable_lockstep() 安装总线发布钩子, 命令在发布者线程上同步处理。
 *               确定性, 用于测试和基准。
 *   - threaded: start() 启动自有时钟线程, 每 frame_ms 执行一次 frame()。
 *               mode = 1 (real) 时位姿在 frames_per_move 帧内插值后才应答,
 *               模拟真实模拟器的异步时序。
 *
 * 位姿 = 格子坐标 × cell_size (+ 可选均匀抖动, 幅度限制在半格以内)
 * 朝向: RIGHT = 0, UP = π/2, LEFT = π, DOWN = -π/2
 */

#include "sim/grid_world.h"
#include "core/message_bus.h"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>

namespace mazerl {

struct SimConfig {
    GridWorldConfig world;
    float    cell_size       = 10.5f;  // 与 EncoderConfig::cell_size 一致
    float    frame_ms        = 16.0f;  // threaded: 帧间隔
    uint32_t frames_per_move = 4;      // threaded + real 模式: 每次移动的插值帧数
    float    pose_jitter     = 0.0f;   // 位姿噪声幅度 (世界单位)
    bool     publish_z       = false;  // 额外发布 Z = 0
    uint32_t seed            = 7;      // 抖动随机种子
};

class GridSimulator {
public:
    GridSimulator(LastValueBus& bus, const SimConfig& config = {});
    ~GridSimulator();

    GridSimulator(const GridSimulator&) = delete;
    GridSimulator& operator=(const GridSimulator&) = delete;

    /** 同步模式: 安装发布钩子 */
    void enable_lockstep();

    /** 异步模式: 启动/停止时钟线程 (start 在 lockstep 已启用时返回 false) */
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    /** 执行一帧 (时钟线程调用; 也可在测试中手动驱动) */
    void frame();

    /** 发布当前位姿和清零的事件标志, 不应答任何命令 */
    void publish_pose();

    // --- 访问器 ---
    const GridWorld& world() const { return world_; }
    const SimConfig& config() const { return config_; }
    int      mode()            const { return mode_; }
    uint64_t frame_count()     const { return frames_; }
    uint64_t commands_handled() const { return commands_; }

private:
    LastValueBus& bus_;
    SimConfig     config_;
    GridWorld     world_;
    std::mt19937  rng_;

    std::mutex           sim_mu_;
    std::thread          thread_;
    std::atomic<bool>    running_{false};
    bool                 lockstep_ = false;
    int                  mode_     = 0;
    uint64_t             frames_   = 0;
    uint64_t             commands_ = 0;

    // 已处理的命令值 (threaded 模式轮询比较)
    int64_t last_step_seq_ = 0;
    int64_t last_reset_    = 0;
    int64_t last_cp_reset_ = 0;

    // threaded + real: 正在插值的移动
    struct PendingMove {
        bool       active = false;
        int64_t    seq    = 0;
        MoveResult result;
        double     from_x = 0.0, from_y = 0.0;
        uint32_t   frames_left = 0;
    };
    PendingMove pending_;
    double theta_ = 0.0;

    void on_publish(const std::string& topic, const BusValue& value);
    void handle_reset(int64_t seq);
    void handle_step(int64_t seq);
    void finish_move(int64_t seq, const MoveResult& r);
    void advance_pending();
    void publish_xy(double x, double y);
    double jitter();
    void run_loop();
};

} // namespace mazerl
