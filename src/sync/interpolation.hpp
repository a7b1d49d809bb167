// SPDX-License-Identifier: Apache-2.0
// interpolation.hpp - Exponential smoothing of remote entities toward their authoritative targets
#pragma once
#include "sim/match_state.hpp"
#include "sync/snapshot.hpp"

#include <string_view>

namespace hax::sync {

struct InterpolationTuning
{
    float player_blend{0.3f};
    float ball_blend{0.3f};
    float ball_catch_up_blend{0.6f};
    float ball_catch_up_distance{50.f};
};

// Moves position and velocity a fixed share of the way toward the target. factor is clamped to [0,1].
void blend_toward(phys::Circle &c, phys::Vec2 target_pos, phys::Vec2 target_vel, float factor);

class Interpolator
{
public:
    explicit Interpolator(InterpolationTuning t = {}) : m_tuning(t) {}

    // Smooths every shadow player present in target except skip_id (the locally predicted one; empty
    // skips nothing).
    void interpolate_players(sim::MatchState &shadow, const TargetState &target, std::string_view skip_id) const;
    // Larger blend while the ball is far from its target.
    void interpolate_ball(phys::Circle &ball, const TargetState &target) const;
    float ball_factor(float distance) const;
    const InterpolationTuning &tuning() const { return m_tuning; }

private:
    InterpolationTuning m_tuning;
};

} // namespace hax::sync
