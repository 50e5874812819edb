#pragma once
/**
 * MazeEnvironment — 总线驱动的迷宫环境
 *
 * 把一个离散动作翻译成一次经模拟器确认的状态转移, 计算塑形奖励, 判定终止。
 *
 * step(a):
 *   1. 发布 Action = a, step_seq = seq
 *   2. 有界等待 ack_seq == seq (旧值永不被当作本步应答)
 *   3. 读取位姿/Collision/checkpoint_reached/GoalReached → 编码新状态
 *   4. 奖励 = 以下各项之和:
 *        (a) step_cost                         每步固定代价 (鼓励最短路径)
 *        (b) collision                          本步碰撞
 *        (c) checkpoint_bonuses[id-1]           id 恰为下一个待领取检查点
 *        (d) goal_reached + streak_bonus·streak 到达目标 (streak = 之前连续无碰撞步数)
 *        (e) loop_penalty                       新状态已在滑动窗口中 (每次重入只罚一次)
 *   5. 终止: 到达目标 / 本 episode 碰撞数达到 collision_limit / 步数达到 max_steps
 *
 * 超时: 返回 fault 结果 (done = true, reason = TRANSPORT_TIMEOUT), 绝不挂起。
 * 非法动作: 不发布任何消息, 返回 fault 结果 (reason = INVALID_ACTION)。
 *
 * 所有奖励数值均为配置项, 不是硬编码常量。
 */

#include "engine/environment.h"
#include "engine/episode_trace.h"
#include "core/message_bus.h"
#include "core/transport_bridge.h"
#include "core/state_encoder.h"
#include <cstdint>
#include <vector>

namespace mazerl {

struct RewardConfig {
    double step_cost    = -1.0;
    double collision    = -13.0;
    double goal_reached = 1000.0;
    double streak_bonus = 20.0;     // 每个连续无碰撞步 (到达目标时结算)
    double loop_penalty = -13.0;
    std::vector<double> checkpoint_bonuses = {50.0, 150.0, 300.0, 500.0};  // id 1..N

    double checkpoint_total() const {
        double t = 0.0;
        for (double b : checkpoint_bonuses) t += b;
        return t;
    }
};

struct EnvConfig {
    uint32_t max_steps       = 225;  // 每 episode 步数上限
    uint32_t collision_limit = 10;   // 碰撞数达到该值即失败终止 (0 = 不限)
    size_t   loop_window     = 6;    // 循环检测滑动窗口
    RewardConfig  rewards;
    EncoderConfig encoder;
    BusWaitConfig wait;
};

class MazeEnvironment : public Environment {
public:
    MazeEnvironment(MessageBus& bus, const EnvConfig& cfg = {});

    // --- Environment interface ---
    State reset() override;
    bool last_reset_ok() const override { return reset_ok_; }
    StepResult step(Action action) override;

    uint32_t step_count() const override { return steps_; }
    uint32_t collision_count() const override { return collisions_; }

    // --- 模拟器命令 ---
    /** 发布仿真模式命令 (0 = fast, 1 = real) */
    void set_mode(int mode);
    /** 请求模拟器清除自身的检查点锁存 */
    void reset_checkpoints();

    // --- 诊断 ---
    const State& current_state() const { return current_; }
    const std::vector<int>& claimed_checkpoints() const { return claimed_; }
    double checkpoint_reward_total() const { return checkpoint_reward_; }
    const EpisodeTrace& trace() const { return trace_; }
    uint32_t streak() const { return streak_; }
    const EnvConfig& config() const { return cfg_; }
    TransportBridge& bridge() { return bridge_; }

private:
    EnvConfig       cfg_;
    TransportBridge bridge_;
    StateEncoder    encoder_;
    EpisodeTrace    trace_;

    // Episode state
    State    current_;
    double   pos_x_ = 0.0, pos_y_ = 0.0, theta_ = 0.0;
    uint32_t steps_       = 0;
    uint32_t collisions_  = 0;
    uint32_t streak_      = 0;
    bool     in_loop_     = false;
    bool     reset_ok_    = false;
    int      last_checkpoint_   = 0;
    double   checkpoint_reward_ = 0.0;
    std::vector<int> claimed_;

    void clear_episode();
    void read_pose();
    /** 领取检查点 (严格递增, 每个 id 至多一次); 成功时写出奖励 */
    bool claim_checkpoint(int64_t id, double& bonus);
    StepResult fault_result(Termination reason);
};

} // namespace mazerl
