// SPDX-License-Identifier: Apache-2.0
// unit_snapshot.cpp
// Snapshot building, merging into TargetState, config subset and roster mirroring.
#include "sim/player.hpp"
#include "sim/simulation.hpp"
#include "sync/snapshot.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace hax;

static void test_build_and_apply()
{
    sim::MatchConfig cfg;
    cfg.kick_mode = sim::KickMode::chargeable;
    sim::Simulation s{cfg, sim::default_map()};
    s.add_player("p1", "alice", sim::Team::red);
    s.add_player("p2", "bob", sim::Team::blue);
    s.start();
    s.step(1.f / 60.f);

    auto snap = sync::build_snapshot(s.state(), s.config(), 42);
    assert(snap.server_tick() == 42);
    assert(snap.players_size() == 2);
    assert(snap.running());
    assert(snap.config().kick_mode() == wire::KICK_CHARGEABLE);

    sync::TargetState target;
    assert(sync::apply_snapshot(target, snap));
    assert(target.server_tick == 42);
    assert(target.players.size() == 2);
    const auto &a = target.players.at("p1");
    assert(a.name == "alice");
    assert(a.team == sim::Team::red);
    assert(a.pos.x == s.state().find_player("p1")->circle.pos.x);
    assert(target.has_ball);
    assert(target.ball_pos.x == s.state().ball.circle.pos.x);
    assert(target.running && !target.finished);
    assert(target.applied == 1);
}

static void test_default_fill()
{
    wire::StateSnapshot snap;
    snap.set_server_tick(7);
    auto *bare = snap.add_players();
    bare->set_id("p9"); // no position, velocity or team
    auto *nameless = snap.add_players();
    nameless->set_name("ghost");
    auto *bad = snap.add_players();
    bad->set_id("p3");
    bad->mutable_pos()->set_x(std::numeric_limits<float>::quiet_NaN());
    bad->mutable_pos()->set_y(10.f);
    bad->set_kick_charge(4.f);

    sync::TargetState target;
    target.has_ball = true;
    target.ball_pos = {123.f, 45.f};
    bool clean = sync::apply_snapshot(target, snap);
    assert(!clean);
    assert(target.players.size() == 2);
    assert(!target.players.contains(""));
    const auto &p9 = target.players.at("p9");
    assert(p9.pos.x == 0.f && p9.pos.y == 0.f);
    assert(p9.team == sim::Team::spectator);
    assert(p9.radius == 0.f);
    const auto &p3 = target.players.at("p3");
    assert(p3.pos.x == 0.f && p3.pos.y == 0.f);
    assert(p3.kick_charge == 1.f);
    // No ball in the snapshot: the previous ball target survives.
    assert(target.ball_pos.x == 123.f);
    assert(target.server_tick == 7);
}

static void test_players_leave()
{
    sync::TargetState target;
    wire::StateSnapshot first;
    first.add_players()->set_id("a");
    first.add_players()->set_id("b");
    assert(sync::apply_snapshot(target, first));
    wire::StateSnapshot second;
    second.add_players()->set_id("b");
    assert(sync::apply_snapshot(target, second));
    assert(target.players.size() == 1);
    assert(target.players.contains("b"));
}

static void test_config_subset()
{
    sim::MatchConfig src;
    src.kick_mode = sim::KickMode::chargeable;
    src.kick_strength = 700.f;
    src.ball.radius = 12.f;
    src.player_speed = 180.f;
    auto subset = sync::build_config_subset(src);

    sim::MatchConfig dst;
    sync::apply_config_subset(dst, subset);
    assert(dst.kick_mode == sim::KickMode::chargeable);
    assert(dst.kick_strength == 700.f);
    assert(dst.ball.radius == 12.f);
    assert(dst.player_speed == 180.f);

    // Zero and non-finite values keep the current setting.
    wire::ConfigSubset junk;
    junk.set_kick_strength(0.f);
    junk.set_ball_radius(-3.f);
    junk.set_player_speed(std::numeric_limits<float>::infinity());
    sync::apply_config_subset(dst, junk);
    assert(dst.kick_strength == 700.f);
    assert(dst.ball.radius == 12.f);
    assert(dst.player_speed == 180.f);
    assert(dst.kick_mode == sim::KickMode::classic);
}

static void test_sync_roster()
{
    sim::MatchConfig cfg;
    sim::MatchState shadow;
    shadow.ball.circle = sim::make_ball_circle({500.f, 300.f}, cfg);
    sim::Player stale;
    stale.id = "gone";
    stale.circle = sim::make_player_circle({10.f, 10.f}, cfg);
    shadow.players.push_back(stale);

    sync::TargetState target;
    sync::EntityTarget et;
    et.name = "newcomer";
    et.team = sim::Team::blue;
    et.pos = {800.f, 300.f};
    et.vel = {-5.f, 0.f};
    target.players.emplace("p4", et);
    target.score = {2, 1};
    target.running = true;
    target.time = 12.5f;

    sync::sync_roster(shadow, target, cfg);
    assert(shadow.players.size() == 1);
    const auto *p = shadow.find_player("p4");
    assert(p);
    assert(p->name == "newcomer");
    assert(p->team == sim::Team::blue);
    assert(p->circle.pos.x == 800.f);
    assert(p->circle.vel.x == -5.f);
    assert(p->circle.radius == cfg.player_radius);
    assert(shadow.score.red == 2 && shadow.score.blue == 1);
    assert(shadow.phase == sim::Phase::running);
    assert(shadow.time == 12.5f);

    // A ball radius change from the config subset reshapes the shadow ball.
    cfg.ball.radius = 14.f;
    sync::sync_roster(shadow, target, cfg);
    assert(shadow.ball.circle.radius == 14.f);
    assert(shadow.ball.circle.pos.x == 500.f);
}

static void test_wire_enums()
{
    for (auto t : {sim::Team::red, sim::Team::blue, sim::Team::spectator})
        assert(sync::from_wire(sync::to_wire(t)) == t);
    assert(sync::from_wire(wire::WINNER_DRAW) == sim::Winner::draw);
    assert(sync::to_wire(sim::Winner::none) == wire::WINNER_NONE);
}

int main()
{
    test_build_and_apply();
    test_default_fill();
    test_players_leave();
    test_config_subset();
    test_sync_roster();
    test_wire_enums();
    std::cout << "unit_snapshot OK" << std::endl;
    return 0;
}
