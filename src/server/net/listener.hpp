// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/server_context.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <memory>

namespace hax::net {

// Starts the TCP accept loop on ctx->config.listen_port; each connection gets its own coroutine that
// flushes queued outbound frames and parses inbound frames.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx);

// Handles one decoded client message for a peer. Returns false when the connection should be dropped.
bool handle_client_message(srv::ServerContext &ctx, const std::shared_ptr<srv::Peer> &peer, const wire::ClientMessage &msg);

// Disconnects peers silent for longer than peer_timeout_ms, checking every heartbeat_check_ms.
coro::task<void> run_heartbeat_monitor(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx);

} // namespace hax::net
