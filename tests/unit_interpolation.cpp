// SPDX-License-Identifier: Apache-2.0
// unit_interpolation.cpp
// Exponential smoothing of remote players and the ball.
#include "sim/player.hpp"
#include "sync/interpolation.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace hax;

static void test_monotonic_no_overshoot()
{
    sim::MatchConfig cfg;
    sim::MatchState shadow;
    sim::Player p;
    p.id = "r1";
    p.circle = sim::make_player_circle({0.f, 0.f}, cfg);
    shadow.players.push_back(p);
    sync::TargetState target;
    sync::EntityTarget et;
    et.pos = {100.f, 50.f};
    et.kick_charge = 0.4f;
    et.is_charging_kick = true;
    target.players.emplace("r1", et);

    sync::Interpolator interp;
    float prev = phys::distance(shadow.players[0].circle.pos, et.pos);
    for (int i = 0; i < 40; ++i) {
        interp.interpolate_players(shadow, target, "");
        const auto &pos = shadow.players[0].circle.pos;
        float d = phys::distance(pos, et.pos);
        assert(d <= prev);
        assert(pos.x <= 100.f && pos.y <= 50.f);
        prev = d;
    }
    assert(prev < 1.f);
    assert(shadow.players[0].kick_charge == 0.4f);
    assert(shadow.players[0].is_charging_kick);

    // First step covers exactly the player blend share.
    shadow.players[0].circle.pos = {0.f, 0.f};
    interp.interpolate_players(shadow, target, "");
    assert(std::fabs(shadow.players[0].circle.pos.x - 30.f) < 1e-3f);
}

static void test_skip_local()
{
    sim::MatchConfig cfg;
    sim::MatchState shadow;
    sim::Player me;
    me.id = "me";
    me.circle = sim::make_player_circle({0.f, 0.f}, cfg);
    shadow.players.push_back(me);
    sync::TargetState target;
    sync::EntityTarget et;
    et.pos = {100.f, 0.f};
    target.players.emplace("me", et);
    sync::Interpolator interp;
    interp.interpolate_players(shadow, target, "me");
    assert(shadow.players[0].circle.pos.x == 0.f);
}

static void test_ball_catch_up()
{
    sync::Interpolator interp;
    assert(interp.ball_factor(10.f) == 0.3f);
    assert(interp.ball_factor(50.f) == 0.3f);
    assert(interp.ball_factor(51.f) == 0.6f);

    sim::MatchConfig cfg;
    auto ball = sim::make_ball_circle({0.f, 0.f}, cfg);
    sync::TargetState target;
    interp.interpolate_ball(ball, target); // no ball target yet
    assert(ball.pos.x == 0.f);
    target.has_ball = true;
    target.ball_pos = {200.f, 0.f};
    interp.interpolate_ball(ball, target);
    assert(std::fabs(ball.pos.x - 120.f) < 1e-3f);
    interp.interpolate_ball(ball, target); // 80 away, still catching up
    assert(std::fabs(ball.pos.x - 168.f) < 1e-3f);
    interp.interpolate_ball(ball, target); // 32 away, normal blend
    assert(ball.pos.x > 177.5f && ball.pos.x < 178.f);
}

static void test_blend_clamped()
{
    auto c = phys::create_circle({0.f, 0.f}, 10.f, 1.f, 1.f);
    sync::blend_toward(c, {10.f, 0.f}, {1.f, 0.f}, 3.f);
    assert(c.pos.x == 10.f && c.vel.x == 1.f);
    sync::blend_toward(c, {20.f, 0.f}, {}, -1.f);
    assert(c.pos.x == 10.f);
}

int main()
{
    test_monotonic_no_overshoot();
    test_skip_local();
    test_ball_catch_up();
    test_blend_clamped();
    std::cout << "unit_interpolation OK" << std::endl;
    return 0;
}
