#include "sim/grid_world.h"
#include "core/log.h"
#include <algorithm>
#include <deque>
#include <sstream>

namespace mazerl {

const char* maze_type_name(MazeType t) {
    switch (t) {
        case MazeType::OPEN_3X3:      return "open3x3";
        case MazeType::CORRIDOR:      return "corridor";
        case MazeType::CLASSIC_10X10: return "classic";
        case MazeType::GENERATED:     return "generated";
        case MazeType::CUSTOM:        return "custom";
    }
    return "?";
}

bool parse_maze_type(const std::string& name, MazeType& out) {
    if (name == "open3x3")   { out = MazeType::OPEN_3X3;      return true; }
    if (name == "corridor")  { out = MazeType::CORRIDOR;      return true; }
    if (name == "classic")   { out = MazeType::CLASSIC_10X10; return true; }
    if (name == "generated") { out = MazeType::GENERATED;     return true; }
    if (name == "custom")    { out = MazeType::CUSTOM;        return true; }
    return false;
}

GridWorld::GridWorld(const GridWorldConfig& config)
    : config_(config)
    , rng_(config.seed)
{
    build(config_.maze_type);
    reset();
}

void GridWorld::reset() {
    agent_x_ = start_x_;
    agent_y_ = start_y_;
    reset_checkpoints();
}

void GridWorld::build(MazeType type) {
    switch (type) {

    case MazeType::OPEN_3X3:
        // S..
        // ...
        // ..G
        load_layout({"S..", "...", "..G"});
        break;

    case MazeType::CORRIDOR:
        // Straight corridor, two checkpoints on the way
        load_layout({"S..1..2..G"});
        break;

    case MazeType::GENERATED:
        generate(config_.width, config_.height);
        break;

    case MazeType::CUSTOM:
        if (!load_layout(config_.layout)) {
            MAZERL_LOG_ERROR("invalid custom maze layout, falling back to classic");
            build(MazeType::CLASSIC_10X10);
        }
        break;

    case MazeType::CLASSIC_10X10:
    default:
        // Fixed 10x10 maze, checkpoints on the shortest route to G (24 moves)
        load_layout({
            "S#########",
            "...1..#.3.",
            "#####.#.#.",
            "#...#.#.#.",
            "#.#.#.2.#.",
            "#.#.###.#4",
            "#.#.....#.",
            "#.#######.",
            "#.........",
            "#########G",
        });
        break;
    }
}

bool GridWorld::load_layout(const std::vector<std::string>& rows) {
    if (rows.empty() || rows[0].empty()) return false;
    size_t w = rows[0].size();
    size_t h = rows.size();

    std::vector<CellType> grid(w * h, CellType::EMPTY);
    std::vector<int> cps(w * h, 0);
    int sx = -1, sy = -1, gx = -1, gy = -1;
    int max_id = 0;

    for (size_t y = 0; y < h; ++y) {
        if (rows[y].size() != w) return false;
        for (size_t x = 0; x < w; ++x) {
            char c = rows[y][x];
            size_t i = y * w + x;
            if (c == '#') {
                grid[i] = CellType::WALL;
            } else if (c == 'S') {
                sx = (int)x; sy = (int)y;
            } else if (c == 'G') {
                grid[i] = CellType::GOAL;
                gx = (int)x; gy = (int)y;
            } else if (c >= '1' && c <= '9') {
                grid[i] = CellType::CHECKPOINT;
                cps[i] = c - '0';
                max_id = std::max(max_id, cps[i]);
            } else if (c != '.') {
                return false;
            }
        }
    }
    if (sx < 0 || gx < 0) return false;

    width_ = w;
    height_ = h;
    grid_ = std::move(grid);
    checkpoint_ = std::move(cps);
    reached_.assign(static_cast<size_t>(max_id), false);
    start_x_ = sx; start_y_ = sy;
    goal_x_ = gx;  goal_y_ = gy;
    agent_x_ = sx; agent_y_ = sy;
    return true;
}

// Recursive backtracker with an explicit stack: cells live on even
// coordinates, odd coordinates are the walls between them.
void GridWorld::generate(size_t w, size_t h) {
    if (w < 3) w = 3;
    if (h < 3) h = 3;
    if (w % 2 == 0) w++;
    if (h % 2 == 0) h++;

    width_ = w;
    height_ = h;
    grid_.assign(w * h, CellType::WALL);
    checkpoint_.assign(w * h, 0);

    std::vector<bool> visited(w * h, false);
    std::vector<std::pair<int, int>> stack;
    stack.push_back({0, 0});
    visited[idx(0, 0)] = true;
    grid_[idx(0, 0)] = CellType::EMPTY;

    const int DX[4] = {0, 0, -2, 2};
    const int DY[4] = {-2, 2, 0, 0};

    while (!stack.empty()) {
        auto [cx, cy] = stack.back();

        int candidates[4];
        int n = 0;
        for (int d = 0; d < 4; ++d) {
            int nx = cx + DX[d], ny = cy + DY[d];
            if (in_bounds(nx, ny) && !visited[idx(nx, ny)]) candidates[n++] = d;
        }
        if (n == 0) {
            stack.pop_back();
            continue;
        }

        std::uniform_int_distribution<int> pick(0, n - 1);
        int d = candidates[pick(rng_)];
        int nx = cx + DX[d], ny = cy + DY[d];
        grid_[idx(cx + DX[d] / 2, cy + DY[d] / 2)] = CellType::EMPTY;
        grid_[idx(nx, ny)] = CellType::EMPTY;
        visited[idx(nx, ny)] = true;
        stack.push_back({nx, ny});
    }

    start_x_ = 0; start_y_ = 0;
    goal_x_ = (int)w - 1; goal_y_ = (int)h - 1;
    grid_[idx(goal_x_, goal_y_)] = CellType::GOAL;
    agent_x_ = start_x_; agent_y_ = start_y_;

    place_checkpoints_on_path(config_.n_checkpoints);
}

void GridWorld::place_checkpoints_on_path(size_t n) {
    auto path = shortest_path();
    size_t placed = 0;
    if (path.size() > 2) {
        size_t inner = path.size() - 2;   // exclude S and G
        n = std::min(n, std::min<size_t>(inner, 9));
        for (size_t k = 1; k <= n; ++k) {
            size_t at = 1 + (k * inner) / (n + 1);
            at = std::min(at, path.size() - 2);
            auto [x, y] = path[at];
            if (checkpoint_[idx(x, y)] != 0) continue;
            grid_[idx(x, y)] = CellType::CHECKPOINT;
            checkpoint_[idx(x, y)] = static_cast<int>(++placed);
        }
    }
    reached_.assign(placed, false);
}

CellType GridWorld::cell(int x, int y) const {
    if (!in_bounds(x, y)) return CellType::WALL;
    return grid_[idx(x, y)];
}

int GridWorld::checkpoint_at(int x, int y) const {
    if (!in_bounds(x, y)) return 0;
    return checkpoint_[idx(x, y)];
}

MoveResult GridWorld::act(Action action) {
    MoveResult result;
    step_count_++;

    int nx = agent_x_, ny = agent_y_;
    switch (action) {
        case Action::UP:    ny--; break;
        case Action::DOWN:  ny++; break;
        case Action::LEFT:  nx--; break;
        case Action::RIGHT: nx++; break;
    }

    if (cell(nx, ny) == CellType::WALL) {
        result.collision = true;
        collision_count_++;
    } else {
        agent_x_ = nx;
        agent_y_ = ny;

        int id = checkpoint_[idx(nx, ny)];
        if (id > 0 && !reached_[static_cast<size_t>(id - 1)]) {
            reached_[static_cast<size_t>(id - 1)] = true;
            result.checkpoint = id;
        }
        if (nx == goal_x_ && ny == goal_y_) {
            result.goal = true;
        }
    }

    result.x = agent_x_;
    result.y = agent_y_;
    return result;
}

std::vector<std::pair<int, int>> GridWorld::shortest_path() const {
    std::vector<int> parent(width_ * height_, -1);
    std::vector<bool> seen(width_ * height_, false);
    std::deque<std::pair<int, int>> queue;
    queue.push_back({start_x_, start_y_});
    seen[idx(start_x_, start_y_)] = true;

    const int DX[4] = {0, 0, -1, 1};
    const int DY[4] = {-1, 1, 0, 0};
    bool found = false;

    while (!queue.empty()) {
        auto [x, y] = queue.front();
        queue.pop_front();
        if (x == goal_x_ && y == goal_y_) { found = true; break; }
        for (int d = 0; d < 4; ++d) {
            int nx = x + DX[d], ny = y + DY[d];
            if (cell(nx, ny) == CellType::WALL || seen[idx(nx, ny)]) continue;
            seen[idx(nx, ny)] = true;
            parent[idx(nx, ny)] = static_cast<int>(idx(x, y));
            queue.push_back({nx, ny});
        }
    }

    std::vector<std::pair<int, int>> path;
    if (!found) return path;
    int cur = static_cast<int>(idx(goal_x_, goal_y_));
    while (cur >= 0) {
        path.push_back({cur % (int)width_, cur / (int)width_});
        cur = parent[static_cast<size_t>(cur)];
    }
    std::reverse(path.begin(), path.end());
    return path;
}

int GridWorld::shortest_path_length() const {
    auto path = shortest_path();
    return path.empty() ? -1 : static_cast<int>(path.size()) - 1;
}

std::string GridWorld::to_string() const {
    std::ostringstream ss;
    for (int y = 0; y < (int)height_; ++y) {
        for (int x = 0; x < (int)width_; ++x) {
            if (x == agent_x_ && y == agent_y_) {
                ss << 'A';
                continue;
            }
            switch (grid_[idx(x, y)]) {
                case CellType::EMPTY:      ss << (x == start_x_ && y == start_y_ ? 'S' : '.'); break;
                case CellType::WALL:       ss << '#'; break;
                case CellType::GOAL:       ss << 'G'; break;
                case CellType::CHECKPOINT: ss << static_cast<char>('0' + checkpoint_[idx(x, y)]); break;
            }
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace mazerl
