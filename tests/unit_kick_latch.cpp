// SPDX-License-Identifier: Apache-2.0
// unit_kick_latch.cpp
// A kick pressed and released between two loop passes still reaches the simulation when the first pass
// runs no fixed step.
#include "server/game/match.hpp"
#include "server/session/session_manager.hpp"
#include "sync/session_context.hpp"

#include <cassert>
#include <iostream>

using namespace hax;

static wire::InputCommand command(uint32_t tick, bool kick)
{
    wire::InputCommand cmd;
    cmd.set_client_tick(tick);
    cmd.set_kick(kick);
    return cmd;
}

int main()
{
    srv::SessionManager sessions;
    auto peer = sessions.add_detached();
    auto joined = sessions.join(peer, "kicker", sim::Team::red, 3);
    assert(joined.team == sim::Team::red);

    sync::SessionOptions opts;
    opts.fixed_step = 1.f / 60.f;
    sync::SessionContext session{sim::MatchConfig{}, sim::default_map(), opts};
    auto *simulation = session.simulation();
    simulation->add_player(peer->player_id, peer->name, peer->team);
    simulation->set_input_source(peer->player_id, input::KeyboardInput{});
    simulation->start();

    // Ball within kick reach but not touching, so only a kick can move it.
    auto &st = simulation->mutable_state();
    auto *me = st.find_player(peer->player_id);
    st.ball.circle.pos = me->circle.pos + phys::Vec2{27.f, 0.f};
    st.ball.circle.vel = {};

    sessions.update_input(peer, command(1, true));
    sessions.update_input(peer, command(2, false));

    // First pass: too short for a fixed step, the press stays latched.
    auto fed = game::feed_peer_inputs(*simulation, sessions);
    assert(fed.size() == 1);
    int steps = session.tick(0.016f);
    assert(steps == 0);
    if (steps > 0)
        game::consume_fed_kicks(sessions, fed);
    assert(sessions.peek_input(peer).flags.kick);

    // Second pass: the step runs with the latched press.
    fed = game::feed_peer_inputs(*simulation, sessions);
    steps = session.tick(0.017f);
    assert(steps == 1);
    game::consume_fed_kicks(sessions, fed);
    assert(!sessions.peek_input(peer).flags.kick);
    assert(simulation->state().ball.circle.vel.x > 0.f);

    // The released flag arrives on the next pass without kicking again.
    float vx = simulation->state().ball.circle.vel.x;
    fed = game::feed_peer_inputs(*simulation, sessions);
    session.tick(1.f / 60.f);
    game::consume_fed_kicks(sessions, fed);
    assert(simulation->state().ball.circle.vel.x <= vx);

    std::cout << "unit_kick_latch OK" << std::endl;
    return 0;
}
