#pragma once
/**
 * MazeRL 基础类型定义
 *
 * 离散状态/动作模型:
 *   - State  : 离散格子坐标 (cell_x, cell_y) + 可选朝向桶 heading
 *   - Action : 固定4动作 {UP, DOWN, LEFT, RIGHT}, 运行时不可扩展
 *   - QRow   : 单个状态下所有动作的数值 (Q值 / 访问计数)
 *
 * 动作枚举顺序即平局裁决顺序 (argmax 取第一个最大值),
 * 探索策略与 Q 更新的 max 都依赖这一约定, 保证测试可复现。
 */

#include <cstdint>
#include <cstddef>
#include <array>
#include <functional>

namespace mazerl {

// =============================================================================
// Action
// =============================================================================

enum class Action : uint8_t {
    UP    = 0,
    DOWN  = 1,
    LEFT  = 2,
    RIGHT = 3
};

constexpr size_t N_ACTIONS = 4;

inline bool is_valid_action_index(int64_t idx) {
    return idx >= 0 && idx < static_cast<int64_t>(N_ACTIONS);
}

inline size_t action_index(Action a) { return static_cast<size_t>(a); }
inline Action action_from_index(size_t i) { return static_cast<Action>(i); }

inline const char* action_name(Action a) {
    switch (a) {
        case Action::UP:    return "UP";
        case Action::DOWN:  return "DOWN";
        case Action::LEFT:  return "LEFT";
        case Action::RIGHT: return "RIGHT";
    }
    return "?";
}

// =============================================================================
// State
// =============================================================================

/** 离散状态键 (值语义, 可哈希). heading=0 表示未编码朝向 */
struct State {
    int32_t x       = 0;
    int32_t y       = 0;
    int32_t heading = 0;

    bool operator==(const State& o) const {
        return x == o.x && y == o.y && heading == o.heading;
    }
    bool operator!=(const State& o) const { return !(*this == o); }
    bool operator<(const State& o) const {
        if (x != o.x) return x < o.x;
        if (y != o.y) return y < o.y;
        return heading < o.heading;
    }
};

struct StateHash {
    size_t operator()(const State& s) const {
        // 2D cell 坐标一般很小, 混合后分布足够均匀
        uint64_t h = static_cast<uint32_t>(s.x);
        h = h * 0x9E3779B97F4A7C15ULL ^ static_cast<uint32_t>(s.y);
        h = h * 0x9E3779B97F4A7C15ULL ^ static_cast<uint32_t>(s.heading);
        return std::hash<uint64_t>()(h);
    }
};

/** 单状态的每动作数值行 (Q值 double, 计数 uint32_t) */
template <typename T>
using ActionRow = std::array<T, N_ACTIONS>;

using QRow = ActionRow<double>;

/**
 * 确定性 argmax: 多个最大值时返回枚举顺序中的第一个
 */
template <typename T>
inline Action argmax_first(const ActionRow<T>& row) {
    size_t best = 0;
    for (size_t i = 1; i < N_ACTIONS; ++i) {
        if (row[i] > row[best]) best = i;
    }
    return action_from_index(best);
}

template <typename T>
inline T row_max(const ActionRow<T>& row) {
    return row[action_index(argmax_first(row))];
}

} // namespace mazerl
