// SPDX-License-Identifier: Apache-2.0
#include "sync/session_context.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <stdexcept>

namespace hax::sync {

namespace {
std::unique_ptr<TickRole> make_role(const sim::MatchConfig &cfg, const sim::GameMap &map, const SessionOptions &o)
{
    switch (o.role) {
        case RoleKind::authority:
            return std::make_unique<AuthorityRole>(cfg, map, o.extrapolation_ms, o.snapshot_interval_steps);
        case RoleKind::predicting_participant:
            return std::make_unique<PredictingParticipantRole>(o.input_heartbeat_steps);
        case RoleKind::spectator:
            return std::make_unique<SpectatorRole>(o.input_heartbeat_steps);
    }
    throw std::invalid_argument("unknown role");
}
} // namespace

SessionContext::SessionContext(sim::MatchConfig cfg, sim::GameMap map, SessionOptions opts)
    : m_cfg(std::move(cfg)),
      m_map(std::move(map)),
      m_opts(std::move(opts)),
      m_clock(m_opts.fixed_step),
      m_role(make_role(m_cfg, m_map, m_opts))
{
    log::debug("[session] role={} local={} map={}", role_name(m_opts.role), m_opts.local_player_id, m_map.name);
}

int SessionContext::tick(float frame_dt)
{
    if (m_stopped || m_paused)
        return 0;
    int steps = m_clock.advance(frame_dt);
    if (m_clock.last_frame_clamped())
        metrics::runtime().clamped_frames.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < steps; ++i) {
        m_role->step(*this, m_clock.step());
        ++m_steps;
    }
    return steps;
}

void SessionContext::on_snapshot(const wire::StateSnapshot &snap)
{
    if (m_stopped)
        return;
    m_role->on_snapshot(*this, snap);
}

RenderView SessionContext::render_view() const
{
    return m_role->render_view(*this, m_clock.alpha());
}

sim::Simulation *SessionContext::simulation()
{
    auto *a = authority();
    return a ? &a->simulation() : nullptr;
}

AuthorityRole *SessionContext::authority()
{
    return dynamic_cast<AuthorityRole *>(m_role.get());
}

RemoteRole *SessionContext::remote()
{
    return dynamic_cast<RemoteRole *>(m_role.get());
}

void SessionContext::set_local_input(input::InputSource src)
{
    if (m_stopped)
        return;
    if (auto *sim = simulation()) {
        if (m_opts.local_player_id.empty())
            throw std::invalid_argument("authority session has no local player");
        sim->set_input_source(m_opts.local_player_id, std::move(src));
        return;
    }
    m_local_input = std::move(src);
}

input::InputSource *SessionContext::local_input()
{
    if (auto *sim = simulation())
        return m_opts.local_player_id.empty() ? nullptr : sim->input_source(m_opts.local_player_id);
    return m_local_input ? &*m_local_input : nullptr;
}

void SessionContext::pause()
{
    if (m_stopped || m_paused)
        return;
    m_paused = true;
    if (auto *sim = simulation())
        sim->pause();
}

void SessionContext::resume()
{
    if (m_stopped || !m_paused)
        return;
    m_paused = false;
    m_clock.reset();
    if (auto *sim = simulation())
        sim->resume();
}

void SessionContext::stop()
{
    if (m_stopped)
        return;
    m_stopped = true;
    if (auto *sim = simulation(); sim && !m_opts.local_player_id.empty())
        sim->clear_input_source(m_opts.local_player_id);
    m_local_input.reset();
    m_snapshot_sink = nullptr;
    m_input_sink = nullptr;
    log::info("[session] stopped role={} steps={}", role_name(m_opts.role), m_steps);
}

void SessionContext::emit_snapshot(const wire::StateSnapshot &snap)
{
    if (m_snapshot_sink)
        m_snapshot_sink(snap);
}

void SessionContext::emit_input(const InputUpdate &update)
{
    if (m_input_sink)
        m_input_sink(update);
}

} // namespace hax::sync
