#pragma once
/**
 * GridWorld — 参考模拟器的离散迷宫
 *
 * 功能:
 *   - W×H 格子迷宫, 墙壁/越界 = 碰撞 (原地不动)
 *   - 有序检查点 1..N: 首次进入时报告 id (每次 reset 后每个 id 只报告一次)
 *   - 目标格: 进入即报告到达
 *   - 不计算奖励 (奖励语义属于 MazeEnvironment)
 *
 * 布局字符:
 *   '.' 空地   '#' 墙   'S' 起点   'G' 目标   '1'..'9' 检查点
 *
 * 迷宫预设:
 *   OPEN_3X3      3×3 空地, S(0,0) → G(2,2)
 *   CORRIDOR      10×1 走廊, 两个检查点
 *   CLASSIC_10X10 10×10 固定迷宫, 4 个检查点 (最短路 24 步)
 *   GENERATED     显式栈深度优先生成 (无递归, 大网格不会栈溢出)
 *   CUSTOM        config.layout 字符串
 */

#include "core/types.h"
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace mazerl {

enum class CellType : uint8_t {
    EMPTY      = 0,
    WALL       = 1,
    CHECKPOINT = 2,
    GOAL       = 3
};

enum class MazeType : uint8_t {
    OPEN_3X3      = 0,
    CORRIDOR      = 1,
    CLASSIC_10X10 = 2,
    GENERATED     = 3,
    CUSTOM        = 4
};

const char* maze_type_name(MazeType t);
bool parse_maze_type(const std::string& name, MazeType& out);

struct GridWorldConfig {
    MazeType maze_type     = MazeType::CLASSIC_10X10;
    size_t   width         = 11;   // GENERATED: 奇数 (偶数自动 +1)
    size_t   height        = 11;
    size_t   n_checkpoints = 3;    // GENERATED: 沿最短路均匀放置
    uint32_t seed          = 42;
    std::vector<std::string> layout;  // CUSTOM
};

struct MoveResult {
    bool collision  = false;
    int  checkpoint = 0;      // 本步首次进入的检查点 id (0 = 无)
    bool goal       = false;
    int  x          = 0;
    int  y          = 0;
};

class GridWorld {
public:
    explicit GridWorld(const GridWorldConfig& config = {});

    /** Agent 回到起点, 清除已报告的检查点 */
    void reset();

    /** 仅清除检查点锁存 */
    void reset_checkpoints() { reached_.assign(reached_.size(), false); }

    /** 执行一个动作 (±1 格) */
    MoveResult act(Action action);

    /** 载入字符串布局, 缺少 S/G 或行长不一致时返回 false 且不修改当前迷宫 */
    bool load_layout(const std::vector<std::string>& rows);

    // --- 访问器 ---
    int agent_x() const { return agent_x_; }
    int agent_y() const { return agent_y_; }
    int start_x() const { return start_x_; }
    int start_y() const { return start_y_; }
    int goal_x()  const { return goal_x_; }
    int goal_y()  const { return goal_y_; }
    size_t width()  const { return width_; }
    size_t height() const { return height_; }
    size_t n_checkpoints() const { return reached_.size(); }
    CellType cell(int x, int y) const;
    int checkpoint_at(int x, int y) const;

    /** BFS 最短路径 (起点 → 目标, 含两端), 不可达时为空 */
    std::vector<std::pair<int, int>> shortest_path() const;
    /** 最短路径步数, 不可达返回 -1 */
    int shortest_path_length() const;

    uint32_t total_steps()      const { return step_count_; }
    uint32_t total_collisions() const { return collision_count_; }

    /** 获取文本表示 (调试) */
    std::string to_string() const;

private:
    GridWorldConfig config_;
    size_t width_  = 0;
    size_t height_ = 0;
    std::vector<CellType> grid_;       // row-major [y * width + x]
    std::vector<int>      checkpoint_; // 检查点 id (0 = 非检查点)
    std::vector<bool>     reached_;    // reached_[id-1]
    int start_x_ = 0, start_y_ = 0;
    int goal_x_  = 0, goal_y_  = 0;
    int agent_x_ = 0, agent_y_ = 0;
    std::mt19937 rng_;

    uint32_t step_count_      = 0;
    uint32_t collision_count_ = 0;

    size_t idx(int x, int y) const { return static_cast<size_t>(y) * width_ + x; }
    bool in_bounds(int x, int y) const {
        return x >= 0 && x < (int)width_ && y >= 0 && y < (int)height_;
    }
    void build(MazeType type);
    void generate(size_t w, size_t h);
    void place_checkpoints_on_path(size_t n);
};

} // namespace mazerl
