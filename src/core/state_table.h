#pragma once
/**
 * StateTable — 稠密状态竞技场 (dense state arena)
 *
 * 稀疏映射 (State, Action) → T 的紧凑实现:
 *   - 每个首次写入的 State 分配一个整数 id
 *   - 数值存于连续数组 rows_[id][action] (= 平铺的 id × N_ACTIONS + action)
 *   - 只读访问未出现的 State 返回默认行 (initial), 不分配
 *   - 行一旦创建永不删除 (clear() 除外, 仅用于显式重置)
 *
 * Q 表 (T=double) 与访问计数 (T=uint32_t) 共用此结构。
 */

#include "core/types.h"
#include <cstdint>
#include <vector>
#include <unordered_map>

namespace mazerl {

template <typename T>
class StateTable {
public:
    using Row = ActionRow<T>;

    explicit StateTable(T initial = T{})
        : initial_(initial)
    {
        default_row_.fill(initial);
    }

    bool contains(const State& s) const { return index_.count(s) > 0; }

    /** 只读行 (未出现的状态返回默认行) */
    const Row& row(const State& s) const {
        auto it = index_.find(s);
        return it == index_.end() ? default_row_ : rows_[it->second];
    }

    /** 可写行 (首次访问时惰性创建) */
    Row& row_mut(const State& s) {
        auto it = index_.find(s);
        if (it != index_.end()) return rows_[it->second];
        uint32_t id = static_cast<uint32_t>(rows_.size());
        index_.emplace(s, id);
        states_.push_back(s);
        rows_.push_back(default_row_);
        return rows_.back();
    }

    T    get(const State& s, Action a) const { return row(s)[action_index(a)]; }
    void set(const State& s, Action a, T v)  { row_mut(s)[action_index(a)] = v; }

    // --- 按 id 遍历 (序列化/统计) ---
    size_t size() const { return rows_.size(); }
    const State& state_at(size_t id) const { return states_[id]; }
    const Row&   row_at(size_t id)   const { return rows_[id]; }

    T initial() const { return initial_; }

    void clear() {
        index_.clear();
        states_.clear();
        rows_.clear();
    }

    bool operator==(const StateTable& o) const {
        if (size() != o.size()) return false;
        for (size_t id = 0; id < size(); ++id) {
            if (!o.contains(states_[id])) return false;
            if (o.row(states_[id]) != rows_[id]) return false;
        }
        return true;
    }

private:
    T   initial_;
    Row default_row_;
    std::unordered_map<State, uint32_t, StateHash> index_;
    std::vector<State> states_;
    std::vector<Row>   rows_;
};

} // namespace mazerl
