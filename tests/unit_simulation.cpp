// SPDX-License-Identifier: Apache-2.0
// unit_simulation.cpp
// Authoritative step: tick order, determinism, goal latch, score/time limits, pause and fault isolation.
#include "common/metrics.hpp"
#include "sim/simulation.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace hax;

static constexpr float kDt = 1.f / 60.f;

static void test_tick_order()
{
    sim::Simulation s{sim::MatchConfig{}, sim::default_map()};
    s.add_player("a", "A", sim::Team::red);
    std::vector<sim::StepPhase> seen;
    s.hooks().on_phase = [&](sim::StepPhase p) { seen.push_back(p); };
    s.step(kDt);
    assert(seen.empty()); // idle: nothing runs
    s.start();
    s.step(kDt);
    std::vector<sim::StepPhase> expected{
        sim::StepPhase::inputs,
        sim::StepPhase::players,
        sim::StepPhase::ball,
        sim::StepPhase::player_pairs,
        sim::StepPhase::player_ball,
        sim::StepPhase::walls,
        sim::StepPhase::goals};
    assert(seen == expected);
}

static std::vector<phys::Vec2> run_scripted(int steps)
{
    sim::MatchConfig cfg;
    sim::Simulation s{cfg, sim::default_map()};
    s.add_player("h", "human", sim::Team::red);
    input::AutonomousBehavior chase;
    chase.strategy = input::Strategy::chase_ball;
    s.add_bot("b1", "chaser", sim::Team::blue, chase);
    input::PatrolBehavior patrol;
    patrol.commands = {
        {input::PatrolCommand::Kind::move, input::Direction::up_right, 500},
        {input::PatrolCommand::Kind::kick, input::Direction::none, 0},
        {input::PatrolCommand::Kind::move, input::Direction::down_left, 500}};
    s.add_bot("b2", "patrol", sim::Team::red, patrol);
    s.start();
    std::vector<phys::Vec2> trace;
    for (int i = 0; i < steps; ++i) {
        sim::PlayerInput in;
        in.right = (i / 30) % 2 == 0;
        in.down = (i / 45) % 2 == 1;
        in.kick = i % 20 == 0;
        s.set_input("h", in);
        s.step(kDt);
        for (const auto &p : s.state().players)
            trace.push_back(p.circle.pos);
        trace.push_back(s.state().ball.circle.pos);
    }
    return trace;
}

static void test_determinism()
{
    auto a = run_scripted(600);
    auto b = run_scripted(600);
    assert(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i)
        assert(std::fabs(a[i].x - b[i].x) < 1e-4f && std::fabs(a[i].y - b[i].y) < 1e-4f);
}

static void test_goal_latch()
{
    sim::MatchConfig cfg;
    cfg.goal_pause_sec = 1.f;
    sim::Simulation s{cfg, sim::default_map()};
    s.add_player("r", "red", sim::Team::red);
    int goals = 0;
    sim::GoalEvent last;
    s.hooks().on_goal = [&](const sim::GoalEvent &ev) {
        ++goals;
        last = ev;
    };
    int resets = 0;
    s.hooks().on_positions_reset = [&] { ++resets; };
    s.start();
    auto &ball = s.mutable_state().ball;
    ball.circle.pos = {950.f, 300.f}; // inside the blue goal
    ball.last_touch_id = "r";
    // Keep the ball parked in the goal for the whole pause.
    for (int i = 0; i < 50; ++i) {
        s.mutable_state().ball.circle.pos = {950.f, 300.f};
        s.mutable_state().ball.circle.vel = {};
        s.step(kDt);
    }
    assert(goals == 1);
    assert(s.state().score.red == 1 && s.state().score.blue == 0);
    assert(s.state().phase == sim::Phase::goal_scored);
    assert(last.scoring_team == sim::Team::red && last.scorer_id == "r" && last.scorer_name == "red");
    for (int i = 0; i < 20; ++i)
        s.step(kDt);
    assert(s.state().phase == sim::Phase::running);
    assert(resets == 1);
    assert(std::fabs(s.state().ball.circle.pos.x - 500.f) < 1e-3f);
    assert(s.state().score.red == 1);
}

static void score_once(sim::Simulation &s, sim::Team attacking)
{
    float x = attacking == sim::Team::red ? 950.f : 50.f;
    s.mutable_state().ball.circle.pos = {x, 300.f};
    s.mutable_state().ball.circle.vel = {};
    s.step(kDt);
    int guard = 0;
    while (s.state().phase == sim::Phase::goal_scored && ++guard < 1000)
        s.step(kDt);
}

static void test_scenario_score_limit()
{
    sim::MatchConfig cfg;
    cfg.score_limit = 3;
    sim::Simulation s{cfg, sim::default_map()};
    s.add_player("r", "red", sim::Team::red);
    s.add_player("b", "blue", sim::Team::blue);
    int ends = 0;
    sim::MatchEndEvent end_ev;
    s.hooks().on_end = [&](const sim::MatchEndEvent &ev) {
        ++ends;
        end_ev = ev;
    };
    s.start();
    for (int g = 0; g < 3; ++g)
        score_once(s, sim::Team::red);
    assert(s.state().finished);
    assert(s.state().phase == sim::Phase::finished);
    assert(s.state().winner == sim::Winner::red);
    assert(ends == 1 && end_ev.winner == sim::Winner::red && end_ev.score.red == 3);
    // Terminal: no further mutation.
    auto score = s.state().score;
    float t = s.state().time;
    score_once(s, sim::Team::blue);
    s.start();
    s.step(kDt);
    assert(s.state().score == score);
    assert(s.state().time == t);
    assert(s.state().finished);
    // Explicit reset leaves the terminal state.
    s.reset();
    assert(!s.state().finished && s.state().phase == sim::Phase::idle);
    assert(s.state().score.red == 0);
    s.start();
    assert(s.state().running);
}

static void test_time_limit()
{
    sim::MatchConfig cfg;
    cfg.time_limit_sec = 1.f;
    sim::Simulation s{cfg, sim::default_map()};
    s.add_player("r", "red", sim::Team::red);
    s.start();
    for (int i = 0; i < 70; ++i)
        s.step(kDt);
    assert(s.state().finished);
    assert(s.state().winner == sim::Winner::draw);
    assert(s.state().time >= 1.f && s.state().time < 1.f + 2 * kDt);
}

static void test_pause_resume()
{
    sim::Simulation s{sim::MatchConfig{}, sim::default_map()};
    s.add_player("r", "red", sim::Team::red);
    std::vector<sim::LogEventKind> logs;
    s.hooks().on_log = [&](sim::LogEventKind k, const std::string &) { logs.push_back(k); };
    s.start();
    s.set_input("r", sim::PlayerInput{false, false, false, true, false});
    s.step(kDt);
    s.pause();
    auto pos = s.state().players[0].circle.pos;
    float t = s.state().time;
    for (int i = 0; i < 10; ++i)
        s.step(kDt);
    assert(s.state().time == t);
    assert(s.state().players[0].circle.pos.x == pos.x);
    s.resume();
    s.step(kDt);
    assert(s.state().players[0].circle.pos.x > pos.x);
    std::vector<sim::LogEventKind> expected{sim::LogEventKind::start, sim::LogEventKind::pause, sim::LogEventKind::resume};
    assert(logs == expected);
}

static void test_fault_isolation()
{
    sim::Simulation s{sim::MatchConfig{}, sim::default_map()};
    s.add_player("bad", "bad", sim::Team::red);
    s.add_player("good", "good", sim::Team::blue);
    s.start();
    s.mutable_state().find_player("bad")->circle.vel = {NAN, 0.f};
    s.set_input("good", sim::PlayerInput{false, false, true, false, false});
    auto faults_before = metrics::runtime().entity_faults.load();
    auto good_before = s.state().find_player("good")->circle.pos;
    for (int i = 0; i < 5; ++i)
        s.step(kDt);
    assert(metrics::runtime().entity_faults.load() > faults_before);
    const auto *good = s.state().find_player("good");
    assert(phys::is_finite(good->circle.pos));
    assert(good->circle.pos.x < good_before.x);
    assert(phys::is_finite(s.state().ball.circle.pos));
}

static void test_roster()
{
    sim::Simulation s{sim::MatchConfig{}, sim::default_map()};
    s.add_player("a", "A", sim::Team::red);
    bool threw = false;
    try {
        s.add_player("a", "again", sim::Team::blue);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    // Spectators never move or collide.
    auto &spec = s.add_player("s", "watcher", sim::Team::spectator);
    spec.circle.pos = {500.f, 300.f}; // on top of the ball
    s.start();
    s.set_input("s", sim::PlayerInput{true, false, false, false, false});
    for (int i = 0; i < 10; ++i)
        s.step(kDt);
    assert(s.state().find_player("s")->circle.pos.y == 300.f);
    assert(s.state().ball.circle.vel.x == 0.f && s.state().ball.circle.vel.y == 0.f);
    assert(s.remove_player("s"));
    assert(!s.remove_player("s"));
    assert(s.state().players.size() == 1);
    threw = false;
    try {
        s.set_input_source("ghost", input::KeyboardInput{});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
}

int main()
{
    test_tick_order();
    test_determinism();
    test_goal_latch();
    test_scenario_score_limit();
    test_time_limit();
    test_pause_resume();
    test_fault_isolation();
    test_roster();
    std::cout << "unit_simulation OK" << std::endl;
    return 0;
}
