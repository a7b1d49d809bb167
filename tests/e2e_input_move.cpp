// SPDX-License-Identifier: Apache-2.0
// e2e_input_move.cpp
// A TCP client joins a live server, holds "right" and sees its player move in later snapshots.
#include "common/framing.hpp"
#include "game.pb.h"
#include "server/game/match.hpp"
#include "server/net/listener.hpp"
#include "server/server_context.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>

using namespace std::chrono_literals;

static coro::task<bool> send_message(coro::net::tcp::client &cli, const hax::wire::ClientMessage &msg)
{
    std::string frame;
    if (!hax::netutil::append_frame(frame, msg))
        co_return false;
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await cli.poll(coro::poll_op::write);
        auto [s, r] = cli.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block)
            rest = r;
        else
            co_return false;
    }
    co_return true;
}

static const hax::wire::PlayerState *find_player(const hax::wire::StateSnapshot &snap, const std::string &id)
{
    for (const auto &p : snap.players())
        if (p.id() == id)
            return &p;
    return nullptr;
}

static coro::task<void> client_flow(
    std::shared_ptr<coro::io_scheduler> sched, std::shared_ptr<hax::srv::ServerContext> ctx, uint16_t port)
{
    co_await sched->yield_for(50ms);
    coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
    auto st = co_await cli.connect(2s);
    assert(st == coro::net::connect_status::connected);

    hax::wire::ClientMessage join;
    join.mutable_join()->set_name("mover");
    join.mutable_join()->set_preferred_team(hax::wire::TEAM_RED);
    bool sent = co_await send_message(cli, join);
    assert(sent);

    // join response, match start, then a snapshot with our player as baseline
    hax::netutil::FrameParseState fps;
    std::string player_id;
    bool got_start = false;
    float start_x = 0.f;
    bool have_baseline = false;
    auto deadline = std::chrono::steady_clock::now() + 6s;
    while (std::chrono::steady_clock::now() < deadline && !have_baseline) {
        co_await cli.poll(coro::poll_op::read, 100ms);
        std::string tmp(4096, '\0');
        auto [rs, span] = cli.recv(tmp);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            break;
        hax::netutil::feed(fps, span);
        std::string pl;
        while (hax::netutil::try_extract(fps, pl)) {
            hax::wire::ServerMessage sm;
            if (!sm.ParseFromArray(pl.data(), static_cast<int>(pl.size())))
                continue;
            if (sm.has_join_response()) {
                player_id = sm.join_response().player_id();
                assert(sm.join_response().team() == hax::wire::TEAM_RED);
                assert(sm.join_response().tick_rate() == 60);
            } else if (sm.has_match_start()) {
                assert(!player_id.empty());
                got_start = true;
            } else if (sm.has_snapshot() && got_start) {
                if (const auto *me = find_player(sm.snapshot(), player_id)) {
                    start_x = me->pos().x();
                    have_baseline = true;
                    break;
                }
            }
        }
    }
    assert(got_start && have_baseline);

    hax::wire::ClientMessage in;
    auto *cmd = in.mutable_input();
    cmd->set_client_tick(1);
    cmd->set_right(true);
    sent = co_await send_message(cli, in);
    assert(sent);

    bool moved = false;
    deadline = std::chrono::steady_clock::now() + 6s;
    while (std::chrono::steady_clock::now() < deadline && !moved) {
        co_await cli.poll(coro::poll_op::read, 100ms);
        std::string tmp(4096, '\0');
        auto [rs, span] = cli.recv(tmp);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            break;
        hax::netutil::feed(fps, span);
        std::string pl;
        while (hax::netutil::try_extract(fps, pl)) {
            hax::wire::ServerMessage sm;
            if (!sm.ParseFromArray(pl.data(), static_cast<int>(pl.size())) || !sm.has_snapshot())
                continue;
            const auto *me = find_player(sm.snapshot(), player_id);
            if (me && me->pos().x() > start_x + 10.f) {
                moved = true;
                break;
            }
        }
    }
    assert(moved);
    ctx->shutdown.store(true);
    std::cout << "e2e_input_move OK" << std::endl;
    co_return;
}

int main()
{
    auto sched = coro::default_executor::io_executor();
    hax::srv::ServerConfig cfg;
    cfg.listen_port = 41110;
    auto ctx = std::make_shared<hax::srv::ServerContext>(cfg);
    sched->spawn(hax::net::run_listener(sched, ctx));
    sched->spawn(hax::game::run_match(sched, ctx));
    coro::sync_wait(client_flow(sched, ctx, cfg.listen_port));
    return 0;
}
