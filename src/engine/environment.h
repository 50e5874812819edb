#pragma once
/**
 * Environment — 抽象环境接口
 *
 * 定义 Agent/Trainer 与外部世界的交互协议:
 *   - reset() : 开始新 episode, 返回初始离散状态
 *   - step(a) : 执行一个动作, 返回 (next_state, reward, done, info)
 *
 * 设计原则:
 *   - 奖励语义完全由 Environment 定义, Trainer/Agent 与策略无关
 *   - 终止原因只是普通返回值 (info.reason), 不是异常控制流
 *   - 传输故障 (模拟器超时) 以 info.fault = true + done = true 报告
 *
 * 实现:
 *   - MazeEnvironment : 通过消息总线驱动外部模拟器
 *   - 测试中可替换为脚本化环境
 */

#include "core/types.h"
#include <cstdint>

namespace mazerl {

/** 单步的模拟器结果分类 */
enum class MoveOutcome : uint8_t {
    MOVED      = 0,
    COLLISION  = 1,
    CHECKPOINT = 2,
    GOAL       = 3,
    FAULT      = 4    // 无关联应答 (传输超时)
};

/** episode 终止原因 */
enum class Termination : uint8_t {
    NONE              = 0,
    GOAL_REACHED      = 1,
    COLLISION_LIMIT   = 2,
    STEP_BUDGET       = 3,
    TRANSPORT_TIMEOUT = 4,
    INVALID_ACTION    = 5     // 动作不在固定动作集内, 训练必须停止
};

const char* outcome_name(MoveOutcome o);
const char* termination_name(Termination t);

struct StepInfo {
    MoveOutcome outcome   = MoveOutcome::MOVED;
    Termination reason    = Termination::NONE;
    bool     success      = false;   // 到达目标
    bool     fault        = false;   // 传输故障, 本步不可用于学习
    bool     loop         = false;   // 本步触发循环惩罚
    int      checkpoint   = 0;       // 本步领取的检查点 id (0 = 无)
    uint32_t steps        = 0;
    uint32_t streak       = 0;       // 连续无碰撞步数
    uint32_t collisions   = 0;
    double   pos_x        = 0.0;
    double   pos_y        = 0.0;
    double   theta        = 0.0;
};

struct StepResult {
    State    next_state;
    double   reward = 0.0;
    bool     done   = false;
    StepInfo info;
};

class Environment {
public:
    virtual ~Environment() = default;

    // --- Lifecycle ---
    virtual State reset() = 0;
    /** 上一次 reset() 是否收到模拟器确认 */
    virtual bool last_reset_ok() const = 0;

    // --- Motor ---
    virtual StepResult step(Action action) = 0;

    // --- Statistics ---
    virtual uint32_t step_count() const = 0;
    virtual uint32_t collision_count() const = 0;
};

} // namespace mazerl
