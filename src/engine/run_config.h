#pragma once
/**
 * RunConfig — 一次运行的全部配置
 *
 * 各模块配置结构体的聚合 (默认值即各结构体的类内默认值)。
 * 覆盖项使用点分键名:
 *
 *   agent.learning_rate = 0.1
 *   strategy.name       = ucb
 *   rewards.checkpoints = 50,150,300,500
 *   environment.steps   = 300
 *   sim.maze            = generated
 *
 * 覆盖文件: 每行一个 "key = value", '#' 开始注释, 空行忽略。
 */

#include "agent/q_agent.h"
#include "agent/exploration_strategy.h"
#include "engine/maze_env.h"
#include "engine/trainer.h"
#include "sim/grid_simulator.h"
#include "core/log.h"
#include <string>
#include <vector>

namespace mazerl {

struct RunConfig {
    AgentConfig    agent;
    StrategyConfig strategy;
    EnvConfig      env;
    TrainerConfig  training;
    SimConfig      sim;
    bool           threaded = false;   // true = 模拟器跑自有时钟线程
    int            mode     = 0;       // 0 = fast, 1 = real
    LogLevel       log_level = LogLevel::INFO;
};

/** 设置单个字段; 未知键或值无法解析时返回 false (cfg 不变) */
bool apply_override(RunConfig& cfg, const std::string& key, const std::string& value);

/** "key=value" 形式 (命令行 --set) */
bool apply_override(RunConfig& cfg, const std::string& assignment);

/** 读取覆盖文件; 文件缺失或任一行无效时返回 false (有效行仍已应用) */
bool load_overrides_file(RunConfig& cfg, const std::string& path);

/** 所有受支持的键 (帮助信息) */
std::vector<std::string> override_keys();

} // namespace mazerl
