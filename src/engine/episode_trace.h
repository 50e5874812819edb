#pragma once
/**
 * EpisodeTrace — 本 episode 最近 K 个访问状态 (循环检测用)
 *
 * 滑动窗口: 长度始终 ≤ window, 超出时丢弃最旧状态。
 * reset() 时清空, 仅服务于循环检测, episode 结束即丢弃。
 */

#include "core/types.h"
#include <algorithm>
#include <deque>

namespace mazerl {

class EpisodeTrace {
public:
    explicit EpisodeTrace(size_t window = 6)
        : window_(window)
    {}

    void push(const State& s) {
        if (window_ == 0) return;
        buffer_.push_back(s);
        if (buffer_.size() > window_) {
            buffer_.pop_front();
        }
    }

    /** 状态是否出现在当前窗口内 */
    bool contains(const State& s) const {
        return std::find(buffer_.begin(), buffer_.end(), s) != buffer_.end();
    }

    void clear() { buffer_.clear(); }

    size_t size() const { return buffer_.size(); }
    size_t window() const { return window_; }
    bool empty() const { return buffer_.empty(); }
    const State& latest() const { return buffer_.back(); }

private:
    size_t window_;
    std::deque<State> buffer_;
};

} // namespace mazerl
