// SPDX-License-Identifier: Apache-2.0
#include "sim/simulation.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/player.hpp"

#include <algorithm>
#include <stdexcept>

namespace hax::sim {

const char *step_phase_name(StepPhase p)
{
    switch (p) {
        case StepPhase::inputs:
            return "inputs";
        case StepPhase::players:
            return "players";
        case StepPhase::ball:
            return "ball";
        case StepPhase::player_pairs:
            return "player_pairs";
        case StepPhase::player_ball:
            return "player_ball";
        case StepPhase::walls:
            return "walls";
        case StepPhase::goals:
            return "goals";
    }
    return "inputs";
}

const char *log_event_name(LogEventKind k)
{
    switch (k) {
        case LogEventKind::start:
            return "start";
        case LogEventKind::pause:
            return "pause";
        case LogEventKind::resume:
            return "resume";
        case LogEventKind::goal:
            return "goal";
        case LogEventKind::end:
            return "end";
        case LogEventKind::reset:
            return "reset";
    }
    return "start";
}

namespace {
void ensure_finite(const phys::Circle &c)
{
    if (!phys::is_finite(c.pos) || !phys::is_finite(c.vel))
        throw std::domain_error("non-finite circle state");
}

bool on_pitch(const Player &p)
{
    return p.team != Team::spectator;
}
} // namespace

Simulation::Simulation(MatchConfig cfg, GameMap map)
    : m_cfg(std::move(cfg)), m_map(std::move(map)), m_player_segments(m_map.player_segments())
{
    m_state.ball.circle = make_ball_circle(m_map.spawns.ball, m_cfg);
}

size_t Simulation::next_spawn_index(Team team) const
{
    return static_cast<size_t>(std::count_if(
        m_state.players.begin(), m_state.players.end(), [team](const Player &p) { return p.team == team; }));
}

Player &Simulation::add_player(std::string id, std::string name, Team team)
{
    if (id.empty())
        throw std::invalid_argument("player id must not be empty");
    if (m_state.find_player(id))
        throw std::invalid_argument("duplicate player id: " + id);
    Player p;
    p.id = std::move(id);
    p.name = std::move(name);
    p.team = team;
    p.spawn_index = next_spawn_index(team);
    p.circle = make_player_circle(m_map.spawn_for(team, p.spawn_index), m_cfg);
    m_state.players.push_back(std::move(p));
    return m_state.players.back();
}

Player &Simulation::add_bot(std::string id, std::string name, Team team, input::BotBehavior behavior)
{
    Player &p = add_player(std::move(id), std::move(name), team);
    m_inputs.insert_or_assign(p.id, input::make_bot_input(behavior));
    p.bot = std::move(behavior);
    return p;
}

bool Simulation::remove_player(std::string_view id)
{
    auto it = std::find_if(
        m_state.players.begin(), m_state.players.end(), [&](const Player &p) { return p.id == id; });
    if (it == m_state.players.end())
        return false;
    if (m_state.ball.last_touch_id == it->id)
        m_state.ball.last_touch_id.clear();
    m_inputs.erase(it->id);
    m_state.players.erase(it);
    return true;
}

void Simulation::set_input_source(std::string_view id, input::InputSource src)
{
    if (!m_state.find_player(id))
        throw std::invalid_argument("unknown player: " + std::string(id));
    m_inputs.insert_or_assign(std::string(id), std::move(src));
}

void Simulation::clear_input_source(std::string_view id)
{
    m_inputs.erase(std::string(id));
}

input::InputSource *Simulation::input_source(std::string_view id)
{
    auto it = m_inputs.find(std::string(id));
    return it == m_inputs.end() ? nullptr : &it->second;
}

void Simulation::set_input(std::string_view id, const PlayerInput &in)
{
    if (auto *p = m_state.find_player(id))
        p->input = in;
}

void Simulation::start()
{
    if (m_state.finished || m_state.running)
        return;
    m_state.running = true;
    m_state.phase = Phase::running;
    m_paused = false;
    log_event(LogEventKind::start, "players=" + std::to_string(m_state.players.size()));
}

void Simulation::pause()
{
    if (!m_state.running || m_state.finished)
        return;
    m_state.running = false;
    m_paused = true;
    log_event(LogEventKind::pause, "time=" + std::to_string(m_state.time));
}

void Simulation::resume()
{
    if (!m_paused || m_state.finished)
        return;
    m_paused = false;
    m_state.running = true;
    log_event(LogEventKind::resume, "time=" + std::to_string(m_state.time));
}

void Simulation::reset()
{
    m_state.score = Score{};
    m_state.time = 0.f;
    m_state.winner = Winner::none;
    m_state.finished = false;
    m_state.running = false;
    m_state.phase = Phase::idle;
    m_state.goal_countdown = 0.f;
    m_paused = false;
    for (auto &[id, src] : m_inputs)
        input::reset(src);
    reset_positions();
    log_event(LogEventKind::reset, "");
}

void Simulation::reset_positions()
{
    for (auto &p : m_state.players) {
        p.circle.pos = m_map.spawn_for(p.team, p.spawn_index);
        p.circle.vel = {};
        p.kick_charge = 0.f;
        p.is_charging_kick = false;
        p.has_kicked_this_press = false;
    }
    m_state.ball.circle.pos = m_map.spawns.ball;
    m_state.ball.circle.vel = {};
    m_state.ball.last_touch_id.clear();
    if (m_hooks.on_positions_reset)
        m_hooks.on_positions_reset();
}

void Simulation::emit_phase(StepPhase p)
{
    if (m_hooks.on_phase)
        m_hooks.on_phase(p);
}

void Simulation::log_event(LogEventKind kind, const std::string &text)
{
    log::info("[match] {} {}", log_event_name(kind), text);
    if (m_hooks.on_log)
        m_hooks.on_log(kind, text);
}

void Simulation::entity_fault(const std::string &entity, const std::exception &e)
{
    metrics::runtime().entity_faults.fetch_add(1, std::memory_order_relaxed);
    HAX_LOG_FIRST_AND_EVERY_N(error, 60, "[match] entity fault entity={} what={} (step skipped)", entity, e.what());
}

void Simulation::step(float dt)
{
    if (!m_state.running || m_state.finished || !(dt > 0.f))
        return;
    ++m_steps;
    metrics::runtime().fixed_steps.fetch_add(1, std::memory_order_relaxed);

    emit_phase(StepPhase::inputs);
    m_state.time += dt;
    if (m_cfg.time_limit_sec > 0.f && m_state.time >= m_cfg.time_limit_sec) {
        end_match();
        return;
    }
    advance_inputs(dt);

    emit_phase(StepPhase::players);
    step_players(dt);

    emit_phase(StepPhase::ball);
    step_ball(dt);

    emit_phase(StepPhase::player_pairs);
    collide_players();

    emit_phase(StepPhase::player_ball);
    collide_player_ball();

    emit_phase(StepPhase::walls);
    collide_walls();

    emit_phase(StepPhase::goals);
    update_goals(dt);
}

void Simulation::advance_inputs(float dt)
{
    for (auto &p : m_state.players) {
        auto it = m_inputs.find(p.id);
        if (it == m_inputs.end())
            continue;
        try {
            input::WorldView view{&m_state, &m_map, p.id};
            input::advance(it->second, dt, m_state.time, view);
            p.input = input::sample(it->second);
        } catch (const std::exception &e) {
            entity_fault(p.id, e);
        }
    }
}

void Simulation::step_players(float dt)
{
    for (auto &p : m_state.players) {
        if (!on_pitch(p))
            continue;
        const phys::Circle saved = p.circle;
        try {
            apply_movement(p, dt, m_cfg);
            if (process_kick(p, m_state.ball.circle, dt, m_cfg)) {
                m_state.ball.last_touch_id = p.id;
                metrics::runtime().kicks_total.fetch_add(1, std::memory_order_relaxed);
            }
            phys::update_circle(p.circle, dt);
            ensure_finite(p.circle);
        } catch (const std::exception &e) {
            p.circle = saved;
            entity_fault(p.id, e);
        }
    }
}

void Simulation::step_ball(float dt)
{
    auto &ball = m_state.ball.circle;
    const phys::Circle saved = ball;
    try {
        phys::update_circle_with_substeps(ball, dt, m_map.segments, m_map.goalposts);
        ensure_finite(ball);
    } catch (const std::exception &e) {
        ball = saved;
        entity_fault("ball", e);
    }
}

void Simulation::collide_players()
{
    auto &ps = m_state.players;
    for (size_t i = 0; i < ps.size(); ++i) {
        if (!on_pitch(ps[i]))
            continue;
        for (size_t j = i + 1; j < ps.size(); ++j) {
            if (!on_pitch(ps[j]))
                continue;
            if (phys::check_circle_collision(ps[i].circle, ps[j].circle))
                phys::resolve_circle_collision(ps[i].circle, ps[j].circle);
        }
    }
}

void Simulation::collide_player_ball()
{
    auto &ball = m_state.ball.circle;
    for (auto &p : m_state.players) {
        if (!on_pitch(p))
            continue;
        if (!phys::check_circle_collision(p.circle, ball))
            continue;
        phys::resolve_circle_collision(p.circle, ball);
        m_state.ball.last_touch_id = p.id;
        if (try_contact_kick(p, ball, m_cfg))
            metrics::runtime().kicks_total.fetch_add(1, std::memory_order_relaxed);
    }
}

void Simulation::collide_walls()
{
    for (auto &p : m_state.players) {
        if (!on_pitch(p))
            continue;
        for (const auto &seg : m_player_segments) {
            if (phys::check_segment_collision(p.circle, seg))
                phys::resolve_segment_collision(p.circle, seg);
        }
    }
}

void Simulation::update_goals(float dt)
{
    if (m_state.phase == Phase::goal_scored) {
        m_state.goal_countdown -= dt;
        if (m_state.goal_countdown > 0.f)
            return;
        m_state.goal_countdown = 0.f;
        const auto &s = m_state.score;
        if (m_cfg.score_limit > 0 && (s.red >= m_cfg.score_limit || s.blue >= m_cfg.score_limit)) {
            end_match();
            return;
        }
        reset_positions();
        m_state.phase = Phase::running;
        return;
    }
    for (const auto &goal : m_map.goals) {
        if (!inside_goal(goal, m_state.ball.circle.pos))
            continue;
        Team scoring = opponent(goal.team);
        if (scoring == Team::red)
            ++m_state.score.red;
        else
            ++m_state.score.blue;
        m_state.phase = Phase::goal_scored;
        m_state.goal_countdown = std::max(m_cfg.goal_pause_sec, 0.f);
        metrics::runtime().goals_total.fetch_add(1, std::memory_order_relaxed);

        GoalEvent ev;
        ev.scoring_team = scoring;
        ev.scorer_id = m_state.ball.last_touch_id;
        if (const auto *scorer = m_state.find_player(ev.scorer_id))
            ev.scorer_name = scorer->name;
        ev.score = m_state.score;
        log_event(
            LogEventKind::goal,
            "team=" + std::string(team_name(scoring)) + " scorer=" + ev.scorer_name + " score=" +
                std::to_string(ev.score.red) + "-" + std::to_string(ev.score.blue));
        if (m_hooks.on_goal)
            m_hooks.on_goal(ev);
        // Without a pause the countdown has already expired.
        if (m_state.goal_countdown <= 0.f)
            update_goals(0.f);
        return;
    }
}

void Simulation::end_match()
{
    if (m_state.finished)
        return;
    m_state.finished = true;
    m_state.running = false;
    m_state.phase = Phase::finished;
    m_state.goal_countdown = 0.f;
    const auto &s = m_state.score;
    m_state.winner = s.red > s.blue ? Winner::red : s.blue > s.red ? Winner::blue : Winner::draw;
    log_event(
        LogEventKind::end,
        "winner=" + std::string(winner_name(m_state.winner)) + " score=" + std::to_string(s.red) + "-" +
            std::to_string(s.blue));
    if (m_hooks.on_end)
        m_hooks.on_end(MatchEndEvent{m_state.winner, m_state.score});
}

} // namespace hax::sim
