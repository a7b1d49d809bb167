// SPDX-License-Identifier: Apache-2.0
// Headless participant: joins a server (or runs an offline match), drives the local player from a bot
// strategy or a recorded tape and logs what a renderer would draw.
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "game.pb.h"
#include "input/input_source.hpp"
#include "input/replay.hpp"
#include "server/config.hpp"
#include "sim/map.hpp"
#include "sim/simulation.hpp"
#include "sync/session_context.hpp"
#include "sync/snapshot.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;

namespace {

struct ClientOptions
{
    std::string host{"127.0.0.1"};
    uint16_t port{40100};
    std::string name{"player"};
    std::optional<hax::sim::Team> team; // nullopt: let the server balance
    bool spectate{false};
    bool predict{true};
    bool offline{false};
    std::string config_path; // offline match rules and bots
    float extrapolate_ms{0.f};
    uint32_t duration_sec{0}; // 0: until the match ends
    std::string strategy{"chase_ball"};
    std::string record_path;
    std::string replay_path;
};

hax::input::InputSource make_local_source(const ClientOptions &opt)
{
    if (!opt.replay_path.empty()) {
        auto tape = hax::input::load_tape(opt.replay_path);
        hax::log::info("[client] replaying {} events ({} ms)", tape.events.size(), tape.total_ms);
        return hax::input::ReplayInput{std::move(tape)};
    }
    auto strategy = hax::input::parse_strategy(opt.strategy);
    if (!strategy)
        throw std::invalid_argument("unknown strategy: " + opt.strategy);
    hax::input::AutonomousBehavior b;
    b.strategy = *strategy;
    b.reaction_delay_ms = 80;
    return hax::input::AutonomousInput{b};
}

// Records the sampled local input as press/release edges in simulated time.
class EdgeRecorder
{
public:
    void begin(const std::string &player_id) { m_recorder.begin(player_id); }

    void observe(double now_ms, const hax::sim::PlayerInput &in)
    {
        if (!m_recorder.recording())
            return;
        auto edge = [&](hax::input::Action a, bool was, bool is)
        {
            if (was != is)
                m_recorder.record(now_ms, a, is);
        };
        edge(hax::input::Action::up, m_last.up, in.up);
        edge(hax::input::Action::down, m_last.down, in.down);
        edge(hax::input::Action::left, m_last.left, in.left);
        edge(hax::input::Action::right, m_last.right, in.right);
        edge(hax::input::Action::kick, m_last.kick, in.kick);
        m_last = in;
    }

    void save(const std::string &path, double now_ms)
    {
        if (!m_recorder.recording())
            return;
        m_recorder.finish(now_ms);
        hax::input::save_tape(path, m_recorder.tape());
        hax::log::info("[client] recorded {} events to {}", m_recorder.tape().events.size(), path);
    }

private:
    hax::input::ReplayRecorder m_recorder;
    hax::sim::PlayerInput m_last;
};

void log_view(const hax::sync::SessionContext &session)
{
    auto view = session.render_view();
    hax::log::info(
        "[view] t={} score={}-{} ball=({},{}) players={} running={}",
        view.time,
        view.score.red,
        view.score.blue,
        view.ball.x,
        view.ball.y,
        view.players.size(),
        view.running);
    for (const auto &p : view.players) {
        hax::log::debug(
            "[view]   {} {} ({},{}) charge={}",
            p.id,
            hax::sim::team_name(p.team),
            p.pos.x,
            p.pos.y,
            p.kick_charge);
    }
}

double sim_ms(const hax::sync::SessionContext &session)
{
    return static_cast<double>(session.steps()) * session.options().fixed_step * 1000.0;
}

void sample_for_record(hax::sync::SessionContext &session, EdgeRecorder &recorder)
{
    if (auto *src = session.local_input())
        recorder.observe(sim_ms(session), hax::input::sample(*src));
}

uint64_t wall_ms()
{
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch())
            .count());
}

// --- networked ---

coro::task<bool> send_all(coro::net::tcp::client &client, const std::string &bytes)
{
    std::span<const char> rest(bytes.data(), bytes.size());
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, remaining] = client.send(rest);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

hax::wire::ClientMessage make_input_message(const hax::sync::InputUpdate &u)
{
    hax::wire::ClientMessage msg;
    auto *ic = msg.mutable_input();
    ic->set_client_tick(u.client_tick);
    ic->set_up(u.input.up);
    ic->set_down(u.input.down);
    ic->set_left(u.input.left);
    ic->set_right(u.input.right);
    ic->set_kick(u.input.kick);
    ic->set_is_charging_kick(u.is_charging_kick);
    ic->set_kick_charge(u.kick_charge);
    return msg;
}

struct NetState
{
    hax::netutil::FrameParseState fps;
    std::string outbound; // framed bytes waiting for the next flush
    std::string player_id;
    hax::sim::Team team{hax::sim::Team::spectator};
    std::unique_ptr<hax::sync::SessionContext> session;
    bool match_over{false};
    bool closed{false};
};

void handle_server_message(NetState &ns, const ClientOptions &opt, const hax::wire::ServerMessage &sm)
{
    if (sm.has_join_response()) {
        ns.player_id = sm.join_response().player_id();
        ns.team = hax::sync::from_wire(sm.join_response().team());
        hax::log::info(
            "[client] joined id={} team={} tick_rate={}",
            ns.player_id,
            hax::sim::team_name(ns.team),
            sm.join_response().tick_rate());
    } else if (sm.has_match_start()) {
        const auto &ms = sm.match_start();
        hax::sim::MatchConfig cfg;
        hax::sync::apply_config_subset(cfg, ms.config());
        cfg.time_limit_sec = static_cast<float>(ms.time_limit_sec());
        cfg.score_limit = ms.score_limit();
        hax::sync::SessionOptions so;
        bool participant = ns.team != hax::sim::Team::spectator;
        so.role = participant && opt.predict ? hax::sync::RoleKind::predicting_participant
                                             : hax::sync::RoleKind::spectator;
        so.local_player_id = participant ? ns.player_id : std::string{};
        ns.session = std::make_unique<hax::sync::SessionContext>(cfg, hax::sim::map_by_name(ms.map_name()), so);
        if (participant) {
            ns.session->set_local_input(make_local_source(opt));
            ns.session->set_input_sink(
                [&ns](const hax::sync::InputUpdate &u)
                {
                    if (!hax::netutil::append_frame(ns.outbound, make_input_message(u)))
                        hax::log::warn("[client] failed to serialize input");
                });
        }
        hax::log::info(
            "[client] match {} map={} role={}",
            ms.match_id(),
            ms.map_name(),
            hax::sync::role_name(ns.session->role_kind()));
    } else if (sm.has_snapshot()) {
        if (ns.session)
            ns.session->on_snapshot(sm.snapshot());
    } else if (sm.has_event()) {
        const auto &ev = sm.event();
        hax::log::info(
            "[event] {} team={} player={} {}",
            hax::wire::MatchEvent::Kind_Name(ev.kind()),
            hax::sim::team_name(hax::sync::from_wire(ev.team())),
            ev.player_id(),
            ev.text());
    } else if (sm.has_match_end()) {
        const auto &me = sm.match_end();
        hax::log::info(
            "[client] match end winner={} score={}-{}",
            hax::sim::winner_name(hax::sync::from_wire(me.winner())),
            me.score().red(),
            me.score().blue());
        ns.match_over = true;
    } else if (sm.has_pong()) {
        auto rtt = wall_ms() - sm.pong().client_time_ms();
        hax::log::debug("[client] rtt={}ms", rtt);
    }
}

// Reads whatever is available without blocking the frame loop.
coro::task<void> pump_inbound(coro::net::tcp::client &cli, NetState &ns, const ClientOptions &opt)
{
    std::string tmp(4096, '\0');
    while (true) {
        auto pstat = co_await cli.poll(coro::poll_op::read, 1ms);
        if (pstat == coro::poll_status::timeout)
            co_return;
        if (pstat != coro::poll_status::event) {
            ns.closed = true;
            co_return;
        }
        auto [st, span] = cli.recv(tmp);
        if (st == coro::net::recv_status::would_block)
            co_return;
        if (st != coro::net::recv_status::ok) {
            ns.closed = true;
            co_return;
        }
        hax::netutil::feed(ns.fps, span);
        std::string payload;
        while (hax::netutil::try_extract(ns.fps, payload)) {
            hax::wire::ServerMessage sm;
            if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                hax::log::warn("[client] failed to parse server message");
                continue;
            }
            handle_server_message(ns, opt, sm);
        }
        if (ns.fps.corrupt) {
            hax::log::error("[client] corrupt frame from server");
            ns.closed = true;
            co_return;
        }
    }
}

coro::task<int> run_networked(std::shared_ptr<coro::io_scheduler> scheduler, ClientOptions opt)
{
    co_await scheduler->schedule();
    coro::net::tcp::client cli{
        scheduler, {.address = coro::net::ip_address::from_string(opt.host), .port = opt.port}};
    auto cstatus = co_await cli.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        hax::log::error("[client] connect to {}:{} failed", opt.host, opt.port);
        co_return 1;
    }
    hax::log::info("[client] connected to {}:{}", opt.host, opt.port);
    NetState ns;
    {
        hax::wire::ClientMessage join;
        auto *jr = join.mutable_join();
        jr->set_name(opt.name);
        jr->set_preferred_team(opt.team ? hax::sync::to_wire(*opt.team) : hax::wire::TEAM_SPECTATOR);
        jr->set_spectate(opt.spectate);
        hax::netutil::append_frame(ns.outbound, join);
    }
    EdgeRecorder recorder;
    bool recorder_started = false;
    using clock = std::chrono::steady_clock;
    const auto frame = std::chrono::microseconds(16'667);
    auto start = clock::now();
    auto last_frame = start;
    auto next_ping = start;
    auto next_view = start + 1s;
    std::optional<clock::time_point> end_seen;
    while (!ns.closed) {
        auto now = clock::now();
        if (opt.duration_sec > 0 && now - start >= std::chrono::seconds(opt.duration_sec))
            break;
        if (ns.match_over && !end_seen)
            end_seen = now;
        if (end_seen && now - *end_seen >= 1s)
            break;
        co_await pump_inbound(cli, ns, opt);
        if (ns.session) {
            if (!recorder_started && !opt.record_path.empty() && !ns.player_id.empty()) {
                recorder.begin(ns.player_id);
                recorder_started = true;
            }
            float dt = std::chrono::duration<float>(now - last_frame).count();
            int steps = ns.session->tick(dt);
            if (steps > 0)
                sample_for_record(*ns.session, recorder);
            if (now >= next_view) {
                log_view(*ns.session);
                next_view = now + 1s;
            }
        }
        last_frame = now;
        if (now >= next_ping) {
            hax::wire::ClientMessage ping;
            ping.mutable_ping()->set_time_ms(wall_ms());
            hax::netutil::append_frame(ns.outbound, ping);
            next_ping = now + 2s;
        }
        if (!ns.outbound.empty()) {
            std::string batch;
            batch.swap(ns.outbound);
            if (!co_await send_all(cli, batch)) {
                hax::log::warn("[client] send failed");
                break;
            }
        }
        co_await scheduler->yield_for(frame);
    }
    if (ns.session) {
        recorder.save(opt.record_path, sim_ms(*ns.session));
        ns.session->stop();
    }
    if (ns.closed)
        hax::log::info("[client] connection closed by server");
    co_return 0;
}

// --- offline ---

int run_offline(const ClientOptions &opt)
{
    hax::srv::ServerConfig cfg;
    if (!opt.config_path.empty())
        cfg = hax::srv::load_server_config(opt.config_path);
    hax::sync::SessionOptions so;
    so.role = hax::sync::RoleKind::authority;
    so.local_player_id = "local";
    so.fixed_step = 1.0f / static_cast<float>(cfg.tick_rate);
    so.extrapolation_ms = opt.extrapolate_ms;
    hax::sync::SessionContext session{cfg.match, hax::sim::map_by_name(cfg.map_name), so};
    auto *sim = session.simulation();
    hax::sim::Team team = opt.team.value_or(hax::sim::Team::red);
    sim->add_player("local", opt.name, team);
    session.set_local_input(make_local_source(opt));
    for (size_t i = 0; i < cfg.bots.size(); ++i) {
        const auto &spec = cfg.bots[i];
        std::string id = "bot_" + std::to_string(i + 1);
        sim->add_bot(id, spec.name.empty() ? id : spec.name, spec.team, spec.behavior);
    }
    sim->hooks().on_goal = [](const hax::sim::GoalEvent &ev)
    {
        hax::log::info(
            "[event] GOAL team={} scorer={} score={}-{}",
            hax::sim::team_name(ev.scoring_team),
            ev.scorer_name,
            ev.score.red,
            ev.score.blue);
    };
    EdgeRecorder recorder;
    if (!opt.record_path.empty())
        recorder.begin("local");
    hax::log::info(
        "[client] offline match map={} players={} extrapolate_ms={}",
        cfg.map_name,
        sim->state().players.size(),
        opt.extrapolate_ms);
    sim->start();

    // Runs as fast as the CPU allows; the fixed-step clock still sees one frame per step.
    const float frame_dt = so.fixed_step;
    const uint64_t max_steps =
        opt.duration_sec > 0 ? static_cast<uint64_t>(opt.duration_sec) * cfg.tick_rate : UINT64_MAX;
    uint64_t last_view_step = 0;
    while (!sim->state().finished && session.steps() < max_steps) {
        session.tick(frame_dt);
        sample_for_record(session, recorder);
        if (session.steps() - last_view_step >= cfg.tick_rate) {
            last_view_step = session.steps();
            log_view(session);
        }
    }
    const auto &st = sim->state();
    hax::log::info(
        "[client] offline finished winner={} score={}-{} t={}",
        hax::sim::winner_name(st.winner),
        st.score.red,
        st.score.blue,
        st.time);
    recorder.save(opt.record_path, sim_ms(session));
    session.stop();
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    ClientOptions opt;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument("missing value for " + a);
                return argv[++i];
            };
            if (a == "--host")
                opt.host = next();
            else if (a == "--port")
                opt.port = static_cast<uint16_t>(std::stoi(next()));
            else if (a == "--name")
                opt.name = next();
            else if (a == "--team") {
                auto t = next();
                if (t != "auto")
                    opt.team = hax::sim::parse_team(t);
            } else if (a == "--spectate")
                opt.spectate = true;
            else if (a == "--no-predict")
                opt.predict = false;
            else if (a == "--offline")
                opt.offline = true;
            else if (a == "--config")
                opt.config_path = next();
            else if (a == "--extrapolate-ms")
                opt.extrapolate_ms = std::stof(next());
            else if (a == "--duration")
                opt.duration_sec = static_cast<uint32_t>(std::stoul(next()));
            else if (a == "--strategy")
                opt.strategy = next();
            else if (a == "--record")
                opt.record_path = next();
            else if (a == "--replay")
                opt.replay_path = next();
            else
                hax::log::warn("Unknown argument '{}', ignoring", a);
        }
    } catch (const std::exception &ex) {
        hax::log::error("Invalid arguments: {}", ex.what());
        return 2;
    }
    if (const char *env_port = std::getenv("HAX_PORT")) {
        try {
            opt.port = static_cast<uint16_t>(std::stoi(env_port));
        } catch (const std::exception &) {
            hax::log::warn("Invalid HAX_PORT value '{}', ignoring", env_port);
        }
    }
    hax::log::init();
    // Several clients often share one terminal.
    if (std::getenv("HAX_LOG_APP_ID") == nullptr)
        hax::log::set_app_id("client:" + opt.name);
    int rc = 0;
    try {
        if (opt.offline) {
            rc = run_offline(opt);
        } else {
            auto scheduler = coro::default_executor::io_executor();
            rc = coro::sync_wait(run_networked(scheduler, opt));
        }
    } catch (const std::exception &ex) {
        hax::log::error("[client] {}", ex.what());
        rc = 1;
    }
    hax::log::info(hax::metrics::summary_json("client"));
    hax::log::flush();
    return rc;
}
