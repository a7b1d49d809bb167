// SPDX-License-Identifier: Apache-2.0
// reconciliation.hpp - Corrects the locally predicted player toward the authoritative snapshot
#pragma once
#include "sim/physics.hpp"

#include <cstdint>

namespace hax::sync {

struct ReconcileTuning
{
    float snap_distance{100.f}; // beyond: teleport (goal reset, respawn)
    float dead_zone{3.f}; // below: leave prediction alone
    float blend{0.2f}; // per-tick share of the remaining error removed
    float settle_epsilon{0.01f}; // a blend finishes exactly on target below this residual
};

enum class Correction : uint8_t
{
    none,
    blend,
    snap
};

// Edge-triggered by snapshots, applied on the following ticks.
class Reconciler
{
public:
    explicit Reconciler(ReconcileTuning t = {}) : m_tuning(t) {}

    // Classifies the prediction error for a freshly arrived authoritative state. A snap or blend is
    // applied from the next tick(); inside the dead zone a running blend is cancelled.
    Correction on_snapshot(const phys::Circle &predicted, phys::Vec2 auth_pos, phys::Vec2 auth_vel);

    // Applies the pending correction for one tick. Returns the remaining position error.
    float tick(phys::Circle &predicted);

    bool active() const { return m_pending != Correction::none; }
    Correction pending() const { return m_pending; }
    const ReconcileTuning &tuning() const { return m_tuning; }
    void reset() { m_pending = Correction::none; }

private:
    ReconcileTuning m_tuning;
    Correction m_pending{Correction::none};
    phys::Vec2 m_target_pos;
    phys::Vec2 m_target_vel;
};

} // namespace hax::sync
