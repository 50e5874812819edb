#pragma once
/**
 * StateEncoder — 连续位姿 → 离散状态
 *
 *   cell_x = round(x / cell_size), cell_y = round(y / cell_size)
 *   heading = round(theta / (2π / buckets)) mod buckets   (buckets > 0 时)
 *
 * 用四舍五入而非截断: 格子中心附近的浮点抖动不会在相邻格子间翻转。
 * 可选钳位 [min_cell, max_cell] 限制状态空间 (实体机器人地图有界)。
 */

#include "core/types.h"

namespace mazerl {

struct EncoderConfig {
    float cell_size       = 10.5f;  // 单步移动距离 = 一格
    int   heading_buckets = 0;      // 0 = 不编码朝向
    bool  clamp           = false;
    int   min_cell        = -5;
    int   max_cell        = 5;
};

class StateEncoder {
public:
    explicit StateEncoder(const EncoderConfig& cfg = {});

    State encode(double x, double y, double theta) const;

    int cell_of(double coord) const;
    int heading_bucket(double theta) const;

    const EncoderConfig& config() const { return cfg_; }

private:
    EncoderConfig cfg_;
};

} // namespace mazerl
