// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "game.pb.h"
#include "server/game/match.hpp"
#include "sync/snapshot.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hax::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<srv::ServerContext> ctx,
    std::shared_ptr<srv::Peer> peer);

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx)
{
    co_await scheduler->schedule();
    const uint16_t port = ctx->config.listen_port;
    log::info("[listener] starting TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!ctx->shutdown.load()) {
        auto status = co_await server.poll(std::chrono::milliseconds(200));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto peer = ctx->sessions.add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, ctx, peer));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

bool handle_client_message(srv::ServerContext &ctx, const std::shared_ptr<srv::Peer> &peer, const wire::ClientMessage &msg)
{
    auto &sessions = ctx.sessions;
    if (msg.has_join()) {
        const auto &jr = msg.join();
        std::optional<sim::Team> preferred;
        if (jr.spectate())
            preferred = sim::Team::spectator;
        else if (jr.preferred_team() != wire::TEAM_SPECTATOR)
            preferred = sync::from_wire(jr.preferred_team());
        auto res = sessions.join(peer, jr.name(), preferred, ctx.config.match.players_per_team);
        wire::ServerMessage resp;
        auto *r = resp.mutable_join_response();
        r->set_player_id(res.player_id);
        r->set_team(sync::to_wire(res.team));
        r->set_tick_rate(ctx.config.tick_rate);
        sessions.push_message(peer, resp);
        sessions.push_message(peer, game::make_match_start(ctx));
        return true;
    }
    if (msg.has_ping()) {
        sessions.update_heartbeat(peer);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now().time_since_epoch())
                          .count();
        wire::ServerMessage pong;
        auto *p = pong.mutable_pong();
        p->set_client_time_ms(msg.ping().time_ms());
        p->set_server_time_ms(static_cast<uint64_t>(now_ms));
        sessions.push_message(peer, pong);
        return true;
    }
    if (!peer->joined) {
        log::debug("[conn] {} message before join ignored", peer->connection_id);
        return true;
    }
    if (msg.has_input()) {
        sessions.update_input(peer, msg.input());
    } else if (msg.has_chat()) {
        wire::ServerMessage ev;
        auto *e = ev.mutable_event();
        e->set_kind(wire::MatchEvent::CHAT);
        e->set_team(sync::to_wire(peer->team));
        e->set_player_id(peer->player_id);
        e->set_text(msg.chat().text());
        sessions.broadcast(ev);
    } else if (msg.has_control()) {
        if (!ctx.config.allow_remote_control) {
            log::warn("[conn] match control from {} rejected (remote control disabled)", peer->player_id);
            return true;
        }
        sessions.push_control({msg.control().action(), peer->player_id});
    }
    return true;
}

// Helper: send all bytes of buffer.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<void> serve_connection(srv::ServerContext &ctx, std::shared_ptr<srv::Peer> peer)
{
    netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (!ctx.shutdown.load() && !peer->disconnected) {
        // Flush pending outbound first (if any)
        auto pending = ctx.sessions.drain_messages(peer);
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 128);
            for (auto &msg : pending) {
                if (!netutil::append_frame(batch, msg))
                    log::warn("[conn] {} failed to serialize outbound message", peer->connection_id);
            }
            if (!co_await send_all(*peer->client, std::span<const char>(batch.data(), batch.size()))) {
                log::warn("[conn] {} send failed", peer->connection_id);
                co_return;
            }
        }
        // Poll read with small timeout so loop progresses to flush snapshots
        auto pstat = co_await peer->client->poll(coro::poll_op::read, std::chrono::milliseconds(5));
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            log::info("[conn] {} poll closed", peer->connection_id);
            co_return;
        }
        auto [rstatus, span] = peer->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            log::info("[conn] {} closed by peer", peer->connection_id);
            co_return;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            log::warn("[conn] {} recv error", peer->connection_id);
            co_return;
        }
        if (rstatus == coro::net::recv_status::ok)
            netutil::feed(fps, span);
        std::string payload;
        while (netutil::try_extract(fps, payload)) {
            wire::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                log::warn("[conn] {} failed to parse protobuf, dropping connection", peer->connection_id);
                co_return;
            }
            if (!handle_client_message(ctx, peer, cmsg))
                co_return;
        }
        if (fps.corrupt) {
            log::warn("[conn] {} invalid frame length, dropping connection", peer->connection_id);
            co_return;
        }
    }
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<srv::ServerContext> ctx,
    std::shared_ptr<srv::Peer> peer)
{
    co_await scheduler->schedule();
    log::info("[conn] new connection {}", peer->connection_id);
    co_await serve_connection(*ctx, peer);
    ctx->sessions.disconnect(peer);
}

coro::task<void> run_heartbeat_monitor(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx)
{
    co_await scheduler->schedule();
    const auto timeout = std::chrono::milliseconds(ctx->config.peer_timeout_ms);
    const auto period = std::chrono::milliseconds(ctx->config.heartbeat_check_ms);
    while (!ctx->shutdown.load()) {
        auto now = std::chrono::steady_clock::now();
        for (auto &p : ctx->sessions.expired(now, timeout)) {
            auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - p->last_heartbeat).count();
            log::warn("[hb] disconnect timeout conn={} player={} silent={}ms", p->connection_id, p->player_id, silent);
            ctx->sessions.disconnect(p);
        }
        co_await scheduler->yield_for(period);
    }
}

} // namespace hax::net
