#pragma once
/**
 * ModelIO — 版本化模型二进制块
 *
 * 一个文件 = 一个原子快照:
 *   header : magic "MZQL" | u32 version | u64 payload_size | u64 fnv1a(payload)
 *   payload: strategy kind | α γ initial_q | 策略参数 (ε, c, novelty)
 *            | Q 表 | 访问计数 | episode 历史
 *
 * 数值按宿主字节序原样写入 (double 逐位保存, 往返完全一致)。
 *
 * 写入: 先写 path.tmp, 成功后 rename 覆盖 path (读者永远看不到半个文件)。
 * 读取: 解析到临时对象, 全部校验通过才返回 OK;
 *       版本不符 → VERSION_MISMATCH, 绝不静默截断或部分恢复。
 */

#include "core/types.h"
#include "core/state_table.h"
#include "agent/exploration_strategy.h"
#include <cstdint>
#include <string>
#include <vector>

namespace mazerl {

constexpr uint32_t MODEL_FORMAT_VERSION = 1;

enum class LoadStatus : uint8_t {
    OK                = 0,
    NOT_FOUND         = 1,
    BAD_MAGIC         = 2,
    VERSION_MISMATCH  = 3,
    STRATEGY_MISMATCH = 4,
    TRUNCATED         = 5,
    CORRUPT           = 6
};

const char* load_status_name(LoadStatus s);

/** 单个 episode 的训练记录 */
struct EpisodeRecord {
    double   reward  = 0.0;
    uint32_t steps   = 0;
    bool     success = false;
};

struct ModelBlob {
    double learning_rate = 0.0;
    double discount      = 0.0;
    double initial_q     = 0.0;
    StrategyState strategy;
    StateTable<double> q_table{0.0};
    std::vector<EpisodeRecord> history;
};

std::vector<char> encode_model(const ModelBlob& blob);
LoadStatus decode_model(const std::vector<char>& bytes, ModelBlob& out);

/** 原子写入 (tmp + rename), 自动创建父目录 */
bool write_model_file(const std::string& path, const ModelBlob& blob);
LoadStatus read_model_file(const std::string& path, ModelBlob& out);

} // namespace mazerl
