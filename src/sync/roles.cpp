// SPDX-License-Identifier: Apache-2.0
#include "sync/roles.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "sync/session_context.hpp"

namespace hax::sync {

const char *role_name(RoleKind k)
{
    switch (k) {
        case RoleKind::authority:
            return "authority";
        case RoleKind::predicting_participant:
            return "predicting_participant";
        case RoleKind::spectator:
            return "spectator";
    }
    return "authority";
}

namespace {
RenderView base_view(const sim::MatchState &st)
{
    RenderView v;
    v.players.reserve(st.players.size());
    for (const auto &p : st.players) {
        v.players.push_back(RenderEntity{p.id, p.name, p.team, p.circle.pos, p.circle.radius, p.kick_charge, p.is_charging_kick});
    }
    v.ball = st.ball.circle.pos;
    v.ball_radius = st.ball.circle.radius;
    v.score = st.score;
    v.time = st.time;
    v.running = st.running;
    v.finished = st.finished;
    v.winner = st.winner;
    return v;
}
} // namespace

// --- AuthorityRole ---

AuthorityRole::AuthorityRole(
    sim::MatchConfig cfg, sim::GameMap map, float extrapolation_ms, uint32_t snapshot_interval_steps)
    : m_sim(std::move(cfg), std::move(map)),
      m_extrapolator(extrapolation_ms),
      m_snapshot_interval(snapshot_interval_steps == 0 ? 1 : snapshot_interval_steps)
{
    m_sim.hooks().on_positions_reset = [this] {
        m_has_prev = false;
        m_extrapolator.invalidate();
    };
}

void AuthorityRole::capture_previous()
{
    const auto &st = m_sim.state();
    m_prev_players.clear();
    for (const auto &p : st.players)
        m_prev_players.emplace(p.id, p.circle.pos);
    m_prev_ball = st.ball.circle.pos;
    m_has_prev = true;
}

void AuthorityRole::step(SessionContext &ctx, float dt)
{
    capture_previous();
    m_sim.step(dt);
    ++m_server_tick;
    if (m_extrapolator.enabled() && !m_sim.state().running) {
        // Nothing moves while idle or finished: render the simulation as it stands.
        m_extrapolator.invalidate();
    } else if (m_extrapolator.enabled()) {
        std::unordered_map<std::string, sim::PlayerInput> inputs;
        for (const auto &p : m_sim.state().players) {
            const auto *src = m_sim.input_source(p.id);
            inputs.emplace(p.id, src ? input::sample(*src) : p.input);
        }
        try {
            m_extrapolator.extrapolate(m_sim.state(), m_sim.map(), m_sim.config(), inputs);
        } catch (const std::exception &e) {
            m_extrapolator.invalidate();
            HAX_LOG_FIRST_AND_EVERY_N(warn, 60, "[sync] extrapolation skipped: {}", e.what());
        }
    }
    if (ctx.has_snapshot_sink() && m_server_tick % m_snapshot_interval == 0)
        ctx.emit_snapshot(build_snapshot(m_sim.state(), m_sim.config(), m_server_tick));
}

void AuthorityRole::on_snapshot(SessionContext &, const wire::StateSnapshot &snap)
{
    HAX_LOG_FIRST_AND_EVERY_N(debug, 300, "[sync] authority ignores snapshot tick={}", snap.server_tick());
}

RenderView AuthorityRole::render_view(const SessionContext &, float alpha) const
{
    RenderView v = base_view(m_sim.state());
    if (m_extrapolator.enabled() && m_extrapolator.has_current()) {
        ProjectedPositions proj = m_extrapolator.project(alpha);
        v.ball = proj.ball;
        for (auto &e : v.players) {
            if (auto it = proj.players.find(e.id); it != proj.players.end())
                e.pos = it->second;
        }
        return v;
    }
    if (!m_has_prev)
        return v;
    v.ball = phys::lerp(m_prev_ball, v.ball, alpha);
    for (auto &e : v.players) {
        if (auto it = m_prev_players.find(e.id); it != m_prev_players.end())
            e.pos = phys::lerp(it->second, e.pos, alpha);
    }
    return v;
}

// --- RemoteRole ---

void RemoteRole::on_snapshot(SessionContext &ctx, const wire::StateSnapshot &snap)
{
    const bool first = m_target.applied == 0;
    apply_snapshot(m_target, snap);
    if (snap.has_config())
        apply_config_subset(ctx.mutable_config(), snap.config());
    sync_roster(m_shadow, m_target, ctx.config());
    if (first) {
        // Nothing to smooth from yet.
        for (auto &p : m_shadow.players) {
            const auto &t = m_target.players.at(p.id);
            p.circle.pos = t.pos;
            p.circle.vel = t.vel;
        }
        m_shadow.ball.circle.pos = m_target.ball_pos;
        m_shadow.ball.circle.vel = m_target.ball_vel;
        log::info("[sync] first snapshot tick={} players={}", m_target.server_tick, m_shadow.players.size());
    }
    after_snapshot(ctx);
}

RenderView RemoteRole::render_view(const SessionContext &, float) const
{
    return base_view(m_shadow);
}

sim::PlayerInput RemoteRole::sample_local(SessionContext &ctx, float dt)
{
    m_local_time += dt;
    auto *src = ctx.local_input();
    if (!src)
        return {};
    input::WorldView view{&m_shadow, &ctx.map(), ctx.local_player_id()};
    input::advance(*src, dt, m_local_time, view);
    return input::sample(*src);
}

void RemoteRole::send_input(SessionContext &ctx, const sim::PlayerInput &in)
{
    if (ctx.local_player_id().empty())
        return;
    const auto *self = m_shadow.find_player(ctx.local_player_id());
    auto update = m_uplink.on_step(in, self && self->is_charging_kick, self ? self->kick_charge : 0.f);
    if (update)
        ctx.emit_input(*update);
}

// --- PredictingParticipantRole ---

void PredictingParticipantRole::after_snapshot(SessionContext &ctx)
{
    const auto &id = ctx.local_player_id();
    auto *self = m_shadow.find_player(id);
    auto it = m_target.players.find(id);
    if (!self || it == m_target.players.end())
        return;
    m_reconciler.on_snapshot(self->circle, it->second.pos, it->second.vel);
}

void PredictingParticipantRole::step(SessionContext &ctx, float dt)
{
    sim::PlayerInput in = sample_local(ctx, dt);
    const auto &id = ctx.local_player_id();
    m_interp.interpolate_players(m_shadow, m_target, id);
    m_interp.interpolate_ball(m_shadow.ball.circle, m_target);
    if (auto *self = m_shadow.find_player(id))
        m_reconciler.tick(self->circle);
    if (m_shadow.running && !m_shadow.finished) {
        try {
            predict_local_player(m_shadow, id, in, ctx.config(), ctx.map(), dt, m_prediction);
        } catch (const std::exception &e) {
            metrics::runtime().entity_faults.fetch_add(1, std::memory_order_relaxed);
            HAX_LOG_FIRST_AND_EVERY_N(error, 60, "[sync] prediction fault id={} what={}", id, e.what());
        }
    }
    send_input(ctx, in);
}

// --- SpectatorRole ---

void SpectatorRole::step(SessionContext &ctx, float dt)
{
    sim::PlayerInput in = sample_local(ctx, dt);
    m_interp.interpolate_players(m_shadow, m_target, {});
    m_interp.interpolate_ball(m_shadow.ball.circle, m_target);
    send_input(ctx, in);
}

} // namespace hax::sync
