// SPDX-License-Identifier: Apache-2.0
#include "sync/reconciliation.hpp"

#include "common/log_rate_limit.hpp"
#include "common/metrics.hpp"

namespace hax::sync {

Correction Reconciler::on_snapshot(const phys::Circle &predicted, phys::Vec2 auth_pos, phys::Vec2 auth_vel)
{
    float err = phys::distance(predicted.pos, auth_pos);
    if (err > m_tuning.snap_distance) {
        m_pending = Correction::snap;
        m_target_pos = auth_pos;
        m_target_vel = auth_vel;
        metrics::sync().reconcile_snaps.fetch_add(1, std::memory_order_relaxed);
        HAX_LOG_FIRST_AND_EVERY_N(debug, 30, "[sync] snap err={}", err);
        return Correction::snap;
    }
    if (err > m_tuning.dead_zone) {
        // A pending snap is never downgraded by a later snapshot.
        if (m_pending != Correction::snap)
            m_pending = Correction::blend;
        m_target_pos = auth_pos;
        m_target_vel = auth_vel;
        metrics::sync().reconcile_blends.fetch_add(1, std::memory_order_relaxed);
        HAX_LOG_EVERY_N(debug, 120, "[sync] blend err={}", err);
        return Correction::blend;
    }
    // Inside the dead zone a running blend stops where it is; a pending snap still lands.
    if (m_pending == Correction::blend)
        m_pending = Correction::none;
    metrics::sync().reconcile_skipped.fetch_add(1, std::memory_order_relaxed);
    return Correction::none;
}

float Reconciler::tick(phys::Circle &predicted)
{
    switch (m_pending) {
        case Correction::none:
            return 0.f;
        case Correction::snap:
            predicted.pos = m_target_pos;
            predicted.vel = m_target_vel;
            m_pending = Correction::none;
            return 0.f;
        case Correction::blend:
            break;
    }
    predicted.pos = phys::lerp(predicted.pos, m_target_pos, m_tuning.blend);
    predicted.vel = phys::lerp(predicted.vel, m_target_vel, m_tuning.blend);
    float residual = phys::distance(predicted.pos, m_target_pos);
    if (residual < m_tuning.settle_epsilon) {
        predicted.pos = m_target_pos;
        predicted.vel = m_target_vel;
        m_pending = Correction::none;
        return 0.f;
    }
    return residual;
}

} // namespace hax::sync
