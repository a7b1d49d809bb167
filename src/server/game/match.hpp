// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "game.pb.h"
#include "server/server_context.hpp"
#include "sim/simulation.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <memory>
#include <vector>

namespace hax::game {

// MatchStart message sent to every peer right after its JoinResponse.
wire::ServerMessage make_match_start(const srv::ServerContext &ctx);

struct FedInput
{
    std::shared_ptr<srv::Peer> peer;
    uint64_t kick_presses{0};
};

// Hands each playing peer's latest flags, latched kick included, to its simulation input source.
std::vector<FedInput> feed_peer_inputs(sim::Simulation &simulation, srv::SessionManager &sessions);
// Releases the kick latches handed out by feed_peer_inputs. Only call after a fixed step ran with them.
void consume_fed_kicks(srv::SessionManager &sessions, const std::vector<FedInput> &fed);

// Authoritative match loop: admits joined peers and configured bots, runs the simulation at the
// configured tick rate, broadcasts snapshots and match events. Returns one second after the match ends
// or when the server shuts down.
coro::task<void> run_match(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx);

} // namespace hax::game
