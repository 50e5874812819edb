/**
 * pymazerl — Python bindings for the MazeRL training engine
 *
 * Exposes the run configuration, TrainingSession (bus + reference simulator +
 * environment + agent + trainer) and the Q-table to Python via pybind11.
 * Enables interactive experiments and plotting of learning curves.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>

#include "core/log.h"
#include "core/types.h"
#include "engine/run_config.h"
#include "engine/session.h"
#include "sim/grid_world.h"

#include <cstdio>

namespace py = pybind11;
using namespace mazerl;

// Helper: Q-table → (states[n,3], q[n,4]) numpy arrays
static std::pair<py::array_t<int32_t>, py::array_t<double>> q_table_to_numpy(const QLearningAgent& agent) {
    const auto& table = agent.q_table();
    size_t n = table.size();
    py::array_t<int32_t> states({static_cast<py::ssize_t>(n), static_cast<py::ssize_t>(3)});
    py::array_t<double>  q({static_cast<py::ssize_t>(n), static_cast<py::ssize_t>(N_ACTIONS)});
    auto s = states.mutable_unchecked<2>();
    auto v = q.mutable_unchecked<2>();
    for (size_t i = 0; i < n; ++i) {
        const State& st = table.state_at(i);
        s(i, 0) = st.x;
        s(i, 1) = st.y;
        s(i, 2) = st.heading;
        const QRow& row = table.row_at(i);
        for (size_t a = 0; a < N_ACTIONS; ++a) v(i, a) = row[a];
    }
    return {states, q};
}

// Helper: per-episode history → dict of numpy arrays (reward, steps, success)
static py::dict history_to_numpy(const QLearningAgent& agent) {
    const auto& hist = agent.history();
    py::array_t<double>  reward(static_cast<py::ssize_t>(hist.size()));
    py::array_t<uint32_t> steps(static_cast<py::ssize_t>(hist.size()));
    py::array_t<bool>    success(static_cast<py::ssize_t>(hist.size()));
    auto r = reward.mutable_unchecked<1>();
    auto s = steps.mutable_unchecked<1>();
    auto g = success.mutable_unchecked<1>();
    for (size_t i = 0; i < hist.size(); ++i) {
        r(i) = hist[i].reward;
        s(i) = hist[i].steps;
        g(i) = hist[i].success;
    }
    py::dict d;
    d["reward"] = reward;
    d["steps"] = steps;
    d["success"] = success;
    return d;
}

PYBIND11_MODULE(pymazerl, m) {
    m.doc() = "MazeRL tabular Q-learning engine Python bindings";

    // =========================================================================
    // Enums
    // =========================================================================
    py::enum_<Action>(m, "Action")
        .value("UP",    Action::UP)
        .value("DOWN",  Action::DOWN)
        .value("LEFT",  Action::LEFT)
        .value("RIGHT", Action::RIGHT);

    py::enum_<StrategyKind>(m, "StrategyKind")
        .value("EPSILON_GREEDY", StrategyKind::EPSILON_GREEDY)
        .value("UCB",            StrategyKind::UCB)
        .value("CURIOSITY",      StrategyKind::CURIOSITY);

    py::enum_<MazeType>(m, "MazeType")
        .value("OPEN_3X3",      MazeType::OPEN_3X3)
        .value("CORRIDOR",      MazeType::CORRIDOR)
        .value("CLASSIC_10X10", MazeType::CLASSIC_10X10)
        .value("GENERATED",     MazeType::GENERATED)
        .value("CUSTOM",        MazeType::CUSTOM);

    py::enum_<Termination>(m, "Termination")
        .value("NONE",              Termination::NONE)
        .value("GOAL_REACHED",      Termination::GOAL_REACHED)
        .value("COLLISION_LIMIT",   Termination::COLLISION_LIMIT)
        .value("STEP_BUDGET",       Termination::STEP_BUDGET)
        .value("TRANSPORT_TIMEOUT", Termination::TRANSPORT_TIMEOUT)
        .value("INVALID_ACTION",    Termination::INVALID_ACTION);

    py::enum_<LoadStatus>(m, "LoadStatus")
        .value("OK",                LoadStatus::OK)
        .value("NOT_FOUND",         LoadStatus::NOT_FOUND)
        .value("BAD_MAGIC",         LoadStatus::BAD_MAGIC)
        .value("VERSION_MISMATCH",  LoadStatus::VERSION_MISMATCH)
        .value("STRATEGY_MISMATCH", LoadStatus::STRATEGY_MISMATCH)
        .value("TRUNCATED",         LoadStatus::TRUNCATED)
        .value("CORRUPT",           LoadStatus::CORRUPT);

    // =========================================================================
    // State
    // =========================================================================
    py::class_<State>(m, "State")
        .def(py::init<>())
        .def(py::init([](int32_t x, int32_t y, int32_t heading) {
            State s; s.x = x; s.y = y; s.heading = heading; return s;
        }), py::arg("x"), py::arg("y"), py::arg("heading") = 0)
        .def_readwrite("x",       &State::x)
        .def_readwrite("y",       &State::y)
        .def_readwrite("heading", &State::heading)
        .def("__eq__", [](const State& a, const State& b) { return a == b; })
        .def("__repr__", [](const State& s) {
            char buf[64];
            snprintf(buf, sizeof(buf), "State(%d, %d, h=%d)", s.x, s.y, s.heading);
            return std::string(buf);
        });

    // =========================================================================
    // Configs
    // =========================================================================
    py::class_<AgentConfig>(m, "AgentConfig")
        .def(py::init<>())
        .def_readwrite("learning_rate",     &AgentConfig::learning_rate)
        .def_readwrite("min_learning_rate", &AgentConfig::min_learning_rate)
        .def_readwrite("lr_decay",          &AgentConfig::lr_decay)
        .def_readwrite("discount_factor",   &AgentConfig::discount_factor)
        .def_readwrite("initial_q",         &AgentConfig::initial_q);

    py::class_<StrategyConfig>(m, "StrategyConfig")
        .def(py::init<>())
        .def_readwrite("kind",          &StrategyConfig::kind)
        .def_readwrite("epsilon",       &StrategyConfig::epsilon)
        .def_readwrite("epsilon_decay", &StrategyConfig::epsilon_decay)
        .def_readwrite("min_epsilon",   &StrategyConfig::min_epsilon)
        .def_readwrite("ucb_c",         &StrategyConfig::ucb_c)
        .def_readwrite("novelty_bonus", &StrategyConfig::novelty_bonus)
        .def_readwrite("seed",          &StrategyConfig::seed);

    py::class_<RewardConfig>(m, "RewardConfig")
        .def(py::init<>())
        .def_readwrite("step_cost",          &RewardConfig::step_cost)
        .def_readwrite("collision",          &RewardConfig::collision)
        .def_readwrite("goal_reached",       &RewardConfig::goal_reached)
        .def_readwrite("streak_bonus",       &RewardConfig::streak_bonus)
        .def_readwrite("loop_penalty",       &RewardConfig::loop_penalty)
        .def_readwrite("checkpoint_bonuses", &RewardConfig::checkpoint_bonuses);

    py::class_<EnvConfig>(m, "EnvConfig")
        .def(py::init<>())
        .def_readwrite("max_steps",       &EnvConfig::max_steps)
        .def_readwrite("collision_limit", &EnvConfig::collision_limit)
        .def_readwrite("loop_window",     &EnvConfig::loop_window)
        .def_readwrite("rewards",         &EnvConfig::rewards);

    py::class_<TrainerConfig>(m, "TrainerConfig")
        .def(py::init<>())
        .def_readwrite("episodes",      &TrainerConfig::episodes)
        .def_readwrite("save_every",    &TrainerConfig::save_every)
        .def_readwrite("model_path",    &TrainerConfig::model_path)
        .def_readwrite("test_episodes", &TrainerConfig::test_episodes)
        .def_readwrite("stats_window",  &TrainerConfig::stats_window)
        .def_readwrite("load_existing", &TrainerConfig::load_existing)
        .def_readwrite("save_model",    &TrainerConfig::save_model);

    py::class_<GridWorldConfig>(m, "GridWorldConfig")
        .def(py::init<>())
        .def_readwrite("maze_type",     &GridWorldConfig::maze_type)
        .def_readwrite("width",         &GridWorldConfig::width)
        .def_readwrite("height",        &GridWorldConfig::height)
        .def_readwrite("n_checkpoints", &GridWorldConfig::n_checkpoints)
        .def_readwrite("seed",          &GridWorldConfig::seed)
        .def_readwrite("layout",        &GridWorldConfig::layout);

    py::class_<SimConfig>(m, "SimConfig")
        .def(py::init<>())
        .def_readwrite("world",           &SimConfig::world)
        .def_readwrite("cell_size",       &SimConfig::cell_size)
        .def_readwrite("frame_ms",        &SimConfig::frame_ms)
        .def_readwrite("frames_per_move", &SimConfig::frames_per_move)
        .def_readwrite("pose_jitter",     &SimConfig::pose_jitter);

    py::class_<RunConfig>(m, "RunConfig")
        .def(py::init<>())
        .def_readwrite("agent",    &RunConfig::agent)
        .def_readwrite("strategy", &RunConfig::strategy)
        .def_readwrite("env",      &RunConfig::env)
        .def_readwrite("training", &RunConfig::training)
        .def_readwrite("sim",      &RunConfig::sim)
        .def_readwrite("threaded", &RunConfig::threaded)
        .def_readwrite("mode",     &RunConfig::mode)
        .def("set", [](RunConfig& c, const std::string& key, const std::string& value) {
            return apply_override(c, key, value);
        }, "Set a field by dotted key, e.g. cfg.set('agent.learning_rate', '0.1')",
           py::arg("key"), py::arg("value"))
        .def("load_file", [](RunConfig& c, const std::string& path) {
            return load_overrides_file(c, path);
        }, py::arg("path"));

    // =========================================================================
    // Results
    // =========================================================================
    py::class_<EpisodeStats>(m, "EpisodeStats")
        .def_readonly("episode",       &EpisodeStats::episode)
        .def_readonly("total_reward",  &EpisodeStats::total_reward)
        .def_readonly("steps",         &EpisodeStats::steps)
        .def_readonly("success",       &EpisodeStats::success)
        .def_readonly("reason",        &EpisodeStats::reason)
        .def_readonly("collisions",    &EpisodeStats::collisions)
        .def_readonly("checkpoints",   &EpisodeStats::checkpoints)
        .def_readonly("max_streak",    &EpisodeStats::max_streak)
        .def_readonly("fault",         &EpisodeStats::fault)
        .def_readonly("epsilon",       &EpisodeStats::epsilon)
        .def_readonly("learning_rate", &EpisodeStats::learning_rate)
        .def("__repr__", [](const EpisodeStats& s) {
            char buf[160];
            snprintf(buf, sizeof(buf), "EpisodeStats(ep=%u, reward=%.1f, steps=%u, %s)",
                     s.episode, s.total_reward, s.steps, termination_name(s.reason));
            return std::string(buf);
        });

    py::class_<TrainingSummary>(m, "TrainingSummary")
        .def_readonly("total_episodes",  &TrainingSummary::total_episodes)
        .def_readonly("episodes",        &TrainingSummary::episodes)
        .def_readonly("mean_reward",     &TrainingSummary::mean_reward)
        .def_readonly("mean_steps",      &TrainingSummary::mean_steps)
        .def_readonly("success_rate",    &TrainingSummary::success_rate)
        .def_readonly("states_explored", &TrainingSummary::states_explored)
        .def_readonly("best_reward",     &TrainingSummary::best_reward)
        .def_readonly("best_episode",    &TrainingSummary::best_episode);

    // =========================================================================
    // GridWorld (reference maze)
    // =========================================================================
    py::class_<GridWorld>(m, "GridWorld", "Discrete maze used by the reference simulator")
        .def(py::init<const GridWorldConfig&>(),
             py::arg("config") = GridWorldConfig{})
        .def("reset",                &GridWorld::reset)
        .def("width",                &GridWorld::width)
        .def("height",               &GridWorld::height)
        .def("n_checkpoints",        &GridWorld::n_checkpoints)
        .def("shortest_path",        &GridWorld::shortest_path)
        .def("shortest_path_length", &GridWorld::shortest_path_length)
        .def("to_string",            &GridWorld::to_string);

    // =========================================================================
    // TrainingSession
    // =========================================================================
    py::class_<TrainingSession, std::unique_ptr<TrainingSession>>(m, "TrainingSession",
        "Bus + reference simulator + environment + Q-learning agent + trainer")
        .def(py::init([](const RunConfig& cfg) {
            return std::make_unique<TrainingSession>(cfg);
        }), py::arg("config") = RunConfig{})
        .def("train", &TrainingSession::train, py::arg("episodes") = 0)
        .def("test",  &TrainingSession::test,  py::arg("episodes") = 0)
        .def("load",  &TrainingSession::load)
        .def("save",  &TrainingSession::save)
        .def("summary", &TrainingSession::summary, py::arg("window") = 0)
        .def("shutdown", &TrainingSession::shutdown)
        .def("set_callback", [](TrainingSession& s, EpisodeCallback cb) {
            s.trainer().set_callback(std::move(cb));
        }, "Called with EpisodeStats after every training episode", py::arg("callback"))
        .def("episodes", [](TrainingSession& s) { return s.trainer().episodes(); })
        .def("q_values", [](TrainingSession& s, const State& st) {
            const QRow& row = s.agent().q_values(st);
            return std::vector<double>(row.begin(), row.end());
        }, py::arg("state"))
        .def("greedy_action", [](TrainingSession& s, const State& st) {
            return s.agent().greedy_action(st);
        }, py::arg("state"))
        .def("q_table", [](TrainingSession& s) { return q_table_to_numpy(s.agent()); },
             "Return (states[n,3], q[n,4]) numpy arrays")
        .def("history", [](TrainingSession& s) { return history_to_numpy(s.agent()); },
             "Per-episode reward/steps/success arrays (including loaded history)")
        .def("states_explored", [](TrainingSession& s) { return s.agent().states_explored(); })
        .def("learning_rate",   [](TrainingSession& s) { return s.agent().learning_rate(); })
        .def("epsilon",         [](TrainingSession& s) { return s.agent().strategy().epsilon(); })
        .def("world", [](TrainingSession& s) -> const GridWorld& { return s.simulator().world(); },
             py::return_value_policy::reference_internal);

    // =========================================================================
    // Logging
    // =========================================================================
    m.def("set_log_level", [](const std::string& name) {
        LogLevel level;
        if (!parse_log_level(name.c_str(), level)) return false;
        set_log_level(level);
        return true;
    }, "error | warn | info | debug", py::arg("level"));

    m.def("version", []() { return "0.1.0"; });
}
