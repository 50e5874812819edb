#include "engine/run_config.h"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>

namespace mazerl {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    // Quoted values: "curiosity" → curiosity
    if (out.size() >= 2 && (out.front() == '"' || out.front() == '\'') && out.back() == out.front()) {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

bool parse_float(const std::string& s, float& out) {
    double d;
    if (!parse_double(s, d)) return false;
    out = static_cast<float>(d);
    return true;
}

bool parse_long(const std::string& s, long long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_u32(const std::string& s, uint32_t& out) {
    long long v;
    if (!parse_long(s, v) || v < 0 || v > 0xFFFFFFFFLL) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

bool parse_size(const std::string& s, size_t& out) {
    long long v;
    if (!parse_long(s, v) || v < 0) return false;
    out = static_cast<size_t>(v);
    return true;
}

bool parse_int(const std::string& s, int& out) {
    long long v;
    if (!parse_long(s, v) || v < -2147483647LL || v > 2147483647LL) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on")  { out = true;  return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

bool parse_unit(const std::string& s, double& out) {
    double v;
    if (!parse_double(s, v) || v < 0.0 || v > 1.0) return false;
    out = v;
    return true;
}

/** "50, 150,300" → {50, 150, 300} */
bool parse_list(const std::string& s, std::vector<double>& out) {
    std::vector<double> vals;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        double v;
        if (!parse_double(trim(item), v)) return false;
        vals.push_back(v);
    }
    out = std::move(vals);
    return true;
}

using Setter = std::function<bool(RunConfig&, const std::string&)>;

struct KeyEntry {
    const char* key;
    Setter      set;
};

// Each setter parses into a local first; cfg is written only on success
const std::vector<KeyEntry>& key_table() {
    static const std::vector<KeyEntry> table = {
        // --- agent ---
        {"agent.learning_rate",     [](RunConfig& c, const std::string& v) { return parse_unit(v, c.agent.learning_rate); }},
        {"agent.min_learning_rate", [](RunConfig& c, const std::string& v) { return parse_unit(v, c.agent.min_learning_rate); }},
        {"agent.lr_decay",          [](RunConfig& c, const std::string& v) { return parse_unit(v, c.agent.lr_decay); }},
        {"agent.discount_factor",   [](RunConfig& c, const std::string& v) { return parse_unit(v, c.agent.discount_factor); }},
        {"agent.initial_q",         [](RunConfig& c, const std::string& v) { return parse_double(v, c.agent.initial_q); }},

        // --- strategy ---
        {"strategy.name", [](RunConfig& c, const std::string& v) { return parse_strategy_kind(v, c.strategy.kind); }},
        {"strategy.epsilon",       [](RunConfig& c, const std::string& v) { return parse_unit(v, c.strategy.epsilon); }},
        {"strategy.epsilon_decay", [](RunConfig& c, const std::string& v) { return parse_unit(v, c.strategy.epsilon_decay); }},
        {"strategy.min_epsilon",   [](RunConfig& c, const std::string& v) { return parse_unit(v, c.strategy.min_epsilon); }},
        {"strategy.ucb_c",         [](RunConfig& c, const std::string& v) { return parse_double(v, c.strategy.ucb_c); }},
        {"strategy.novelty_bonus", [](RunConfig& c, const std::string& v) { return parse_double(v, c.strategy.novelty_bonus); }},
        {"strategy.seed",          [](RunConfig& c, const std::string& v) { return parse_u32(v, c.strategy.seed); }},

        // --- rewards ---
        {"rewards.step_cost",    [](RunConfig& c, const std::string& v) { return parse_double(v, c.env.rewards.step_cost); }},
        {"rewards.collision",    [](RunConfig& c, const std::string& v) { return parse_double(v, c.env.rewards.collision); }},
        {"rewards.goal_reached", [](RunConfig& c, const std::string& v) { return parse_double(v, c.env.rewards.goal_reached); }},
        {"rewards.streak_bonus", [](RunConfig& c, const std::string& v) { return parse_double(v, c.env.rewards.streak_bonus); }},
        {"rewards.loop_penalty", [](RunConfig& c, const std::string& v) { return parse_double(v, c.env.rewards.loop_penalty); }},
        {"rewards.checkpoints",  [](RunConfig& c, const std::string& v) { return parse_list(v, c.env.rewards.checkpoint_bonuses); }},

        // --- environment ---
        {"environment.steps",            [](RunConfig& c, const std::string& v) { return parse_u32(v, c.env.max_steps); }},
        {"environment.collision_limit",  [](RunConfig& c, const std::string& v) { return parse_u32(v, c.env.collision_limit); }},
        {"environment.loop_window",      [](RunConfig& c, const std::string& v) { return parse_size(v, c.env.loop_window); }},
        {"environment.step_timeout_ms",  [](RunConfig& c, const std::string& v) { return parse_float(v, c.env.wait.step_timeout_ms); }},
        {"environment.reset_timeout_ms", [](RunConfig& c, const std::string& v) { return parse_float(v, c.env.wait.reset_timeout_ms); }},
        {"environment.poll_interval_ms", [](RunConfig& c, const std::string& v) { return parse_float(v, c.env.wait.poll_interval_ms); }},
        {"environment.heading_buckets",  [](RunConfig& c, const std::string& v) { return parse_int(v, c.env.encoder.heading_buckets); }},
        {"environment.cell_size", [](RunConfig& c, const std::string& v) {
            float f;
            if (!parse_float(v, f) || f <= 0.0f) return false;
            c.env.encoder.cell_size = f;
            c.sim.cell_size = f;
            return true;
        }},

        // --- training ---
        {"training.episodes",      [](RunConfig& c, const std::string& v) { return parse_u32(v, c.training.episodes); }},
        {"training.save_every",    [](RunConfig& c, const std::string& v) { return parse_u32(v, c.training.save_every); }},
        {"training.model_path",    [](RunConfig& c, const std::string& v) {
            if (v.empty()) return false;
            c.training.model_path = v;
            return true;
        }},
        {"training.test_episodes", [](RunConfig& c, const std::string& v) { return parse_u32(v, c.training.test_episodes); }},
        {"training.stats_window",  [](RunConfig& c, const std::string& v) { return parse_size(v, c.training.stats_window); }},
        {"training.load_existing", [](RunConfig& c, const std::string& v) { return parse_bool(v, c.training.load_existing); }},
        {"training.save_model",    [](RunConfig& c, const std::string& v) { return parse_bool(v, c.training.save_model); }},

        // --- reference simulator ---
        {"sim.maze",        [](RunConfig& c, const std::string& v) { return parse_maze_type(v, c.sim.world.maze_type); }},
        {"sim.width",       [](RunConfig& c, const std::string& v) { return parse_size(v, c.sim.world.width); }},
        {"sim.height",      [](RunConfig& c, const std::string& v) { return parse_size(v, c.sim.world.height); }},
        {"sim.seed",        [](RunConfig& c, const std::string& v) { return parse_u32(v, c.sim.world.seed); }},
        {"sim.checkpoints", [](RunConfig& c, const std::string& v) { return parse_size(v, c.sim.world.n_checkpoints); }},
        {"sim.frame_ms",    [](RunConfig& c, const std::string& v) { return parse_float(v, c.sim.frame_ms); }},
        {"sim.frames_per_move", [](RunConfig& c, const std::string& v) { return parse_u32(v, c.sim.frames_per_move); }},
        {"sim.jitter",      [](RunConfig& c, const std::string& v) { return parse_float(v, c.sim.pose_jitter); }},
        {"sim.threaded",    [](RunConfig& c, const std::string& v) { return parse_bool(v, c.threaded); }},
        {"sim.mode",        [](RunConfig& c, const std::string& v) { return parse_int(v, c.mode); }},

        // --- log ---
        {"log.level", [](RunConfig& c, const std::string& v) { return parse_log_level(v.c_str(), c.log_level); }},
    };
    return table;
}

} // anonymous namespace

bool apply_override(RunConfig& cfg, const std::string& key, const std::string& value) {
    std::string k = trim(key);
    std::string v = trim(value);
    for (const auto& e : key_table()) {
        if (k != e.key) continue;
        RunConfig tmp = cfg;
        if (!e.set(tmp, v)) {
            MAZERL_LOG_ERROR("invalid value '%s' for %s", v.c_str(), k.c_str());
            return false;
        }
        cfg = tmp;
        return true;
    }
    MAZERL_LOG_ERROR("unknown config key '%s'", k.c_str());
    return false;
}

bool apply_override(RunConfig& cfg, const std::string& assignment) {
    size_t eq = assignment.find('=');
    if (eq == std::string::npos) {
        MAZERL_LOG_ERROR("expected key=value, got '%s'", assignment.c_str());
        return false;
    }
    return apply_override(cfg, assignment.substr(0, eq), assignment.substr(eq + 1));
}

bool load_overrides_file(RunConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        MAZERL_LOG_ERROR("cannot open config file %s", path.c_str());
        return false;
    }

    bool ok = true;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        if (trim(line).empty()) continue;

        if (line.find('=') == std::string::npos || !apply_override(cfg, line)) {
            MAZERL_LOG_ERROR("%s:%d: invalid line", path.c_str(), lineno);
            ok = false;
        }
    }
    return ok;
}

std::vector<std::string> override_keys() {
    std::vector<std::string> keys;
    for (const auto& e : key_table()) keys.push_back(e.key);
    return keys;
}

} // namespace mazerl
