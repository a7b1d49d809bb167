// SPDX-License-Identifier: Apache-2.0
// unit_roles.cpp
// Authority, predicting participant and spectator sessions wired together inside one process.
#include "sync/session_context.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

using namespace hax;
using sync::RoleKind;

static constexpr float kFrame = 0.02f;

static void test_three_sessions_one_process()
{
    sim::MatchConfig cfg;
    auto map = sim::default_map();

    sync::SessionOptions auth_opts;
    auth_opts.role = RoleKind::authority;
    auth_opts.snapshot_interval_steps = 2;
    sync::SessionContext authority{cfg, map, auth_opts};
    auto *auth_sim = authority.simulation();
    assert(auth_sim);
    auth_sim->add_player("p1", "alice", sim::Team::red);
    auth_sim->add_player("p2", "bob", sim::Team::blue);

    sync::SessionOptions part_opts;
    part_opts.role = RoleKind::predicting_participant;
    part_opts.local_player_id = "p1";
    sync::SessionContext participant{cfg, map, part_opts};
    assert(!participant.simulation());
    assert(participant.remote());

    sync::SessionOptions spec_opts;
    spec_opts.role = RoleKind::spectator;
    sync::SessionContext spectator{cfg, map, spec_opts};

    int snapshots = 0;
    authority.set_snapshot_sink([&](const wire::StateSnapshot &snap) {
        ++snapshots;
        participant.on_snapshot(snap);
        spectator.on_snapshot(snap);
    });
    int uplinks = 0;
    participant.set_input_sink([&](const sync::InputUpdate &u) {
        ++uplinks;
        auth_sim->set_input("p1", u.input);
    });

    input::KeyboardInput keys;
    keys.set_key(input::Action::right, true);
    participant.set_local_input(keys);
    assert(participant.local_input());

    auth_sim->start();
    for (int i = 0; i < 90; ++i) {
        authority.tick(kFrame);
        participant.tick(kFrame);
        spectator.tick(kFrame);
    }
    assert(authority.steps() > 90);
    assert(snapshots > 40);
    // Right is held throughout: one send on first step plus heartbeats, not one per step.
    assert(uplinks >= 1);
    assert(static_cast<uint64_t>(uplinks) < participant.steps());

    const auto &auth_p1 = *auth_sim->state().find_player("p1");
    assert(auth_p1.circle.pos.x > 230.f);

    const auto *remote = participant.remote();
    assert(remote->target().applied == static_cast<uint64_t>(snapshots));
    const auto &shadow = participant.view_state();
    assert(shadow.players.size() == 2);
    assert(shadow.running);
    const auto *pred_p1 = shadow.find_player("p1");
    assert(pred_p1 && pred_p1->circle.pos.x > 230.f);
    assert(phys::distance(pred_p1->circle.pos, auth_p1.circle.pos) < 40.f);

    // The spectator follows the authority without predicting.
    const auto *seen_p1 = spectator.view_state().find_player("p1");
    assert(seen_p1);
    assert(phys::distance(seen_p1->circle.pos, auth_p1.circle.pos) < 40.f);
    auto view = spectator.render_view();
    assert(view.players.size() == 2);
    assert(view.running);

    // Stop detaches local input and sinks; later snapshots are ignored.
    participant.stop();
    assert(participant.stopped());
    assert(!participant.local_input());
    assert(participant.tick(kFrame) == 0);
    uint64_t applied = participant.remote()->target().applied;
    authority.set_snapshot_sink([&](const wire::StateSnapshot &snap) { participant.on_snapshot(snap); });
    authority.tick(kFrame * 4);
    assert(participant.remote()->target().applied == applied);
}

static void test_authority_local_input()
{
    sync::SessionOptions opts;
    opts.role = RoleKind::authority;
    opts.local_player_id = "local";
    opts.extrapolation_ms = 80.f;
    sync::SessionContext ctx{sim::MatchConfig{}, sim::default_map(), opts};
    ctx.simulation()->add_player("local", "me", sim::Team::red);
    input::KeyboardInput keys;
    keys.set_key(input::Action::down, true);
    ctx.set_local_input(keys);
    assert(ctx.local_input());
    assert(std::holds_alternative<input::KeyboardInput>(*ctx.local_input()));
    ctx.simulation()->start();
    for (int i = 0; i < 30; ++i)
        ctx.tick(kFrame);
    const auto *me = ctx.view_state().find_player("local");
    assert(me->circle.pos.y > 300.f);

    // Render positions run ahead of the simulation while extrapolating.
    auto view = ctx.render_view();
    assert(view.players.size() == 1);
    assert(view.players[0].pos.y > me->circle.pos.y);

    ctx.pause();
    assert(ctx.paused());
    assert(ctx.tick(kFrame) == 0);
    ctx.resume();
    assert(ctx.tick(kFrame) >= 1);

    ctx.stop();
    assert(!ctx.simulation()->input_source("local"));
    assert(ctx.tick(kFrame) == 0);
}

static void test_no_extrapolation_once_finished()
{
    sim::MatchConfig cfg;
    cfg.time_limit_sec = 0.2f;
    sync::SessionOptions opts;
    opts.role = RoleKind::authority;
    opts.local_player_id = "local";
    opts.extrapolation_ms = 200.f;
    sync::SessionContext ctx{cfg, sim::default_map(), opts};
    ctx.simulation()->add_player("local", "me", sim::Team::red);
    input::KeyboardInput keys;
    keys.set_key(input::Action::right, true);
    ctx.set_local_input(keys);
    ctx.simulation()->start();
    for (int i = 0; i < 30; ++i)
        ctx.tick(kFrame);
    assert(ctx.view_state().finished);
    assert(!ctx.view_state().running);

    // Right is still held, but nothing is drawn ahead of the frozen state.
    const auto &st = ctx.view_state();
    auto view = ctx.render_view();
    assert(view.players.size() == 1);
    assert(phys::distance(view.players[0].pos, st.find_player("local")->circle.pos) < 0.01f);
    assert(phys::distance(view.ball, st.ball.circle.pos) < 0.01f);
}

static void test_authority_without_local_player()
{
    sync::SessionContext ctx{sim::MatchConfig{}, sim::default_map(), sync::SessionOptions{}};
    assert(ctx.role_kind() == RoleKind::authority);
    assert(!ctx.local_input());
    bool threw = false;
    try {
        ctx.set_local_input(input::IdleInput{});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    assert(std::string(sync::role_name(RoleKind::spectator)) == "spectator");
}

int main()
{
    test_three_sessions_one_process();
    test_authority_local_input();
    test_no_extrapolation_once_finished();
    test_authority_without_local_player();
    std::cout << "unit_roles OK" << std::endl;
    return 0;
}
