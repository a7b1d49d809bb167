// SPDX-License-Identifier: Apache-2.0
#include "server/game/match.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sim/simulation.hpp"
#include "sync/session_context.hpp"
#include "sync/snapshot.hpp"

#include <chrono>
#include <variant>

namespace hax::game {

namespace {

wire::ServerMessage make_event(wire::MatchEvent::Kind kind, sim::Team team, const std::string &player_id, const std::string &text)
{
    wire::ServerMessage msg;
    auto *e = msg.mutable_event();
    e->set_kind(kind);
    e->set_team(sync::to_wire(team));
    e->set_player_id(player_id);
    e->set_text(text);
    return msg;
}

wire::MatchEvent::Kind event_kind(sim::LogEventKind k)
{
    switch (k) {
        case sim::LogEventKind::start:
            return wire::MatchEvent::START;
        case sim::LogEventKind::pause:
            return wire::MatchEvent::PAUSE;
        case sim::LogEventKind::resume:
            return wire::MatchEvent::RESUME;
        case sim::LogEventKind::goal:
            return wire::MatchEvent::GOAL;
        case sim::LogEventKind::end:
            return wire::MatchEvent::END;
        case sim::LogEventKind::reset:
            return wire::MatchEvent::RESET;
    }
    return wire::MatchEvent::START;
}

void install_hooks(sim::Simulation &simulation, srv::SessionManager &sessions)
{
    auto &hooks = simulation.hooks();
    hooks.on_goal = [&sessions](const sim::GoalEvent &ev)
    {
        log::info(
            "[match] goal team={} scorer={} score={}-{}",
            sim::team_name(ev.scoring_team),
            ev.scorer_id.empty() ? "-" : ev.scorer_id,
            ev.score.red,
            ev.score.blue);
        sessions.broadcast(make_event(wire::MatchEvent::GOAL, ev.scoring_team, ev.scorer_id, ev.scorer_name));
    };
    hooks.on_end = [&sessions](const sim::MatchEndEvent &ev)
    {
        log::info("[match] end winner={} score={}-{}", sim::winner_name(ev.winner), ev.score.red, ev.score.blue);
        wire::ServerMessage msg;
        auto *me = msg.mutable_match_end();
        me->set_winner(sync::to_wire(ev.winner));
        me->mutable_score()->set_red(ev.score.red);
        me->mutable_score()->set_blue(ev.score.blue);
        sessions.broadcast(msg);
    };
    // Goal and end carry their own payloads above; the rest are plain state-change notices.
    hooks.on_log = [&sessions](sim::LogEventKind kind, const std::string &text)
    {
        log::debug("[match] {} {}", sim::log_event_name(kind), text);
        if (kind == sim::LogEventKind::goal)
            return;
        sessions.broadcast(make_event(event_kind(kind), sim::Team::spectator, "", text));
    };
}

void admit_bots(sim::Simulation &simulation, srv::SessionManager &sessions, const srv::ServerConfig &cfg)
{
    uint32_t red = 0;
    uint32_t blue = 0;
    for (size_t i = 0; i < cfg.bots.size(); ++i) {
        const auto &spec = cfg.bots[i];
        std::string id = "bot_" + std::to_string(i + 1);
        std::string name = spec.name.empty() ? id : spec.name;
        simulation.add_bot(id, name, spec.team, spec.behavior);
        if (spec.team == sim::Team::red)
            ++red;
        else if (spec.team == sim::Team::blue)
            ++blue;
        log::info(
            "[match] bot {} name={} team={} behavior={}",
            id,
            name,
            sim::team_name(spec.team),
            input::behavior_kind(spec.behavior));
    }
    sessions.set_reserved(red, blue);
    metrics::runtime().bots_in_match.store(cfg.bots.size(), std::memory_order_relaxed);
}

// Roster changes and control requests queued by connection coroutines since the previous tick.
void apply_session_changes(sync::SessionContext &session, srv::ServerContext &ctx)
{
    auto *simulation = session.simulation();
    for (auto &peer : ctx.sessions.take_new_players()) {
        try {
            simulation->add_player(peer->player_id, peer->name, peer->team);
            simulation->set_input_source(peer->player_id, input::KeyboardInput{});
            log::info("[match] player {} ({}) joined team={}", peer->player_id, peer->name, sim::team_name(peer->team));
        } catch (const std::invalid_argument &e) {
            log::warn("[match] cannot add player {}: {}", peer->player_id, e.what());
        }
    }
    for (auto &id : ctx.sessions.take_departed()) {
        const auto *p = simulation->state().find_player(id);
        if (!p)
            continue;
        sim::Team team = p->team;
        simulation->remove_player(id);
        log::info("[match] player {} left", id);
        ctx.sessions.broadcast(make_event(wire::MatchEvent::PARTICIPANT_LEFT, team, id, ""));
    }
    for (auto &req : ctx.sessions.take_controls()) {
        log::info("[match] control {} from {}", wire::MatchControl::Action_Name(req.action), req.player_id);
        switch (req.action) {
            case wire::MatchControl::PAUSE:
                session.pause();
                break;
            case wire::MatchControl::RESUME:
                session.resume();
                break;
            case wire::MatchControl::RESET:
                simulation->reset();
                simulation->start();
                break;
            default:
                break;
        }
    }
}

} // namespace

std::vector<FedInput> feed_peer_inputs(sim::Simulation &simulation, srv::SessionManager &sessions)
{
    std::vector<FedInput> fed;
    for (auto &peer : sessions.joined_peers()) {
        if (peer->team == sim::Team::spectator)
            continue;
        auto *src = simulation.input_source(peer->player_id);
        if (!src)
            continue;
        if (auto *kb = std::get_if<input::KeyboardInput>(src)) {
            auto in = sessions.peek_input(peer);
            kb->set_flags(in.flags);
            fed.push_back({peer, in.kick_presses});
        }
    }
    return fed;
}

void consume_fed_kicks(srv::SessionManager &sessions, const std::vector<FedInput> &fed)
{
    for (const auto &f : fed)
        sessions.consume_kick(f.peer, f.kick_presses);
}

wire::ServerMessage make_match_start(const srv::ServerContext &ctx)
{
    wire::ServerMessage msg;
    auto *ms = msg.mutable_match_start();
    ms->set_match_id(ctx.match_id);
    ms->set_map_name(ctx.config.map_name);
    *ms->mutable_config() = sync::build_config_subset(ctx.config.match);
    ms->set_time_limit_sec(static_cast<uint32_t>(ctx.config.match.time_limit_sec));
    ms->set_score_limit(ctx.config.match.score_limit);
    return msg;
}

coro::task<void> run_match(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<srv::ServerContext> ctx)
{
    co_await scheduler->schedule();
    const auto &cfg = ctx->config;
    sync::SessionOptions opts;
    opts.role = sync::RoleKind::authority;
    opts.fixed_step = 1.0f / static_cast<float>(cfg.tick_rate);
    opts.snapshot_interval_steps = cfg.snapshot_interval_ticks;
    sync::SessionContext session{cfg.match, sim::map_by_name(cfg.map_name), opts};
    auto *simulation = session.simulation();
    install_hooks(*simulation, ctx->sessions);
    admit_bots(*simulation, ctx->sessions, cfg);
    session.set_snapshot_sink(
        [ctx](const wire::StateSnapshot &snap)
        {
            wire::ServerMessage msg;
            *msg.mutable_snapshot() = snap;
            metrics::add_snapshot_sent(msg.ByteSizeLong());
            ctx->sessions.broadcast(msg);
        });
    metrics::runtime().active_matches.fetch_add(1, std::memory_order_relaxed);
    log::info(
        "[match] start id={} map={} tick_rate={} time_limit={}s score_limit={} bots={}",
        ctx->match_id,
        cfg.map_name,
        cfg.tick_rate,
        cfg.match.time_limit_sec,
        cfg.match.score_limit,
        cfg.bots.size());
    simulation->start();

    using clock = std::chrono::steady_clock;
    auto tick_interval = std::chrono::nanoseconds((1'000'000'000ull + cfg.tick_rate / 2) / cfg.tick_rate);
    auto next = clock::now();
    auto last_frame = next;
    // Snapshots keep flowing for one second after the end so clients render the final state.
    uint32_t grace_ticks_left = cfg.tick_rate;
    while (!ctx->shutdown.load()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(wait_dur);
            continue;
        }
        auto tick_start = now;
        next += tick_interval;
        float frame_dt = std::chrono::duration<float>(now - last_frame).count();
        last_frame = now;

        apply_session_changes(session, *ctx);
        auto fed = feed_peer_inputs(*simulation, ctx->sessions);
        // A pass that ran no fixed step keeps kick presses latched for the next one.
        if (session.tick(frame_dt) > 0)
            consume_fed_kicks(ctx->sessions, fed);

        auto tick_end = clock::now();
        metrics::add_tick_duration(
            static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(tick_end - tick_start).count()));
        if (simulation->state().finished) {
            if (grace_ticks_left == 0)
                break;
            --grace_ticks_left;
        }
    }
    ctx->match_finished.store(true);
    metrics::decrement(metrics::runtime().active_matches);
    metrics::runtime().bots_in_match.store(0, std::memory_order_relaxed);
    log::info("[match] finished id={} steps={}", ctx->match_id, session.steps());
    co_return;
}

} // namespace hax::game
