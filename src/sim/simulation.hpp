// SPDX-License-Identifier: Apache-2.0
// simulation.hpp - Authoritative match simulation: one fixed step applies input, integrates, resolves
// collisions in a fixed order, detects goals and advances the match state machine.
#pragma once
#include "input/input_source.hpp"
#include "sim/map.hpp"
#include "sim/match_state.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hax::sim {

// Order of work inside step(). Observable through SimulationHooks::on_phase.
enum class StepPhase : uint8_t
{
    inputs,
    players,
    ball,
    player_pairs,
    player_ball,
    walls,
    goals
};

const char *step_phase_name(StepPhase p);

struct GoalEvent
{
    Team scoring_team{Team::spectator};
    std::string scorer_id; // last player to touch the ball, may be empty
    std::string scorer_name;
    Score score;
};

struct MatchEndEvent
{
    Winner winner{Winner::none};
    Score score;
};

enum class LogEventKind : uint8_t
{
    start,
    pause,
    resume,
    goal,
    end,
    reset
};

const char *log_event_name(LogEventKind k);

struct SimulationHooks
{
    std::function<void(const GoalEvent &)> on_goal;
    std::function<void(const MatchEndEvent &)> on_end;
    std::function<void(LogEventKind, const std::string &)> on_log;
    // Fired after players and ball were moved back to their spawns (goal reset or match reset).
    std::function<void()> on_positions_reset;
    std::function<void(StepPhase)> on_phase;
};

class Simulation
{
public:
    Simulation(MatchConfig cfg, GameMap map);

    // Throws std::invalid_argument when the id is empty or already present.
    Player &add_player(std::string id, std::string name, Team team);
    Player &add_bot(std::string id, std::string name, Team team, input::BotBehavior behavior);
    bool remove_player(std::string_view id);

    // Players with an input source have their flags sampled from it every step; others keep the flags
    // written through set_input.
    void set_input_source(std::string_view id, input::InputSource src);
    void clear_input_source(std::string_view id);
    input::InputSource *input_source(std::string_view id);
    void set_input(std::string_view id, const PlayerInput &in);

    // Idle -> Running. No-op once finished.
    void start();
    void pause();
    void resume();
    // Clears score, time and winner, respawns everyone and returns to Idle.
    void reset();
    void step(float dt);
    void reset_positions();

    const MatchState &state() const { return m_state; }
    // Direct access for hosts that script scenarios (tests, offline tools).
    MatchState &mutable_state() { return m_state; }
    const MatchConfig &config() const { return m_cfg; }
    const GameMap &map() const { return m_map; }
    SimulationHooks &hooks() { return m_hooks; }
    uint64_t step_count() const { return m_steps; }
    bool paused() const { return m_paused; }

private:
    void emit_phase(StepPhase p);
    void advance_inputs(float dt);
    void step_players(float dt);
    void step_ball(float dt);
    void collide_players();
    void collide_player_ball();
    void collide_walls();
    void update_goals(float dt);
    void end_match();
    void log_event(LogEventKind kind, const std::string &text);
    void entity_fault(const std::string &entity, const std::exception &e);
    size_t next_spawn_index(Team team) const;

    MatchConfig m_cfg;
    GameMap m_map;
    std::vector<phys::Segment> m_player_segments;
    MatchState m_state;
    std::unordered_map<std::string, input::InputSource> m_inputs;
    SimulationHooks m_hooks;
    uint64_t m_steps{0};
    bool m_paused{false};
};

} // namespace hax::sim
