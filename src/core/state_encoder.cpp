#include "core/state_encoder.h"
#include <algorithm>
#include <cmath>

namespace mazerl {

StateEncoder::StateEncoder(const EncoderConfig& cfg)
    : cfg_(cfg)
{
    if (cfg_.cell_size <= 0.0f) cfg_.cell_size = 1.0f;
    if (cfg_.heading_buckets < 0) cfg_.heading_buckets = 0;
}

int StateEncoder::cell_of(double coord) const {
    int c = static_cast<int>(std::lround(coord / cfg_.cell_size));
    if (cfg_.clamp) c = std::max(cfg_.min_cell, std::min(cfg_.max_cell, c));
    return c;
}

int StateEncoder::heading_bucket(double theta) const {
    if (cfg_.heading_buckets <= 0) return 0;
    constexpr double TWO_PI = 6.283185307179586;
    double t = std::fmod(theta, TWO_PI);
    if (t < 0.0) t += TWO_PI;
    double sector = TWO_PI / cfg_.heading_buckets;
    long b = std::lround(t / sector);
    return static_cast<int>(b % cfg_.heading_buckets);
}

State StateEncoder::encode(double x, double y, double theta) const {
    State s;
    s.x = cell_of(x);
    s.y = cell_of(y);
    s.heading = heading_bucket(theta);
    return s;
}

} // namespace mazerl
