// SPDX-License-Identifier: Apache-2.0
#include "sync/interpolation.hpp"

#include <algorithm>

namespace hax::sync {

void blend_toward(phys::Circle &c, phys::Vec2 target_pos, phys::Vec2 target_vel, float factor)
{
    factor = std::clamp(factor, 0.f, 1.f);
    c.pos = phys::lerp(c.pos, target_pos, factor);
    c.vel = phys::lerp(c.vel, target_vel, factor);
}

void Interpolator::interpolate_players(sim::MatchState &shadow, const TargetState &target, std::string_view skip_id) const
{
    for (auto &p : shadow.players) {
        if (!skip_id.empty() && p.id == skip_id)
            continue;
        auto it = target.players.find(p.id);
        if (it == target.players.end())
            continue;
        blend_toward(p.circle, it->second.pos, it->second.vel, m_tuning.player_blend);
        p.kick_charge = it->second.kick_charge;
        p.is_charging_kick = it->second.is_charging_kick;
    }
}

float Interpolator::ball_factor(float distance) const
{
    return distance > m_tuning.ball_catch_up_distance ? m_tuning.ball_catch_up_blend : m_tuning.ball_blend;
}

void Interpolator::interpolate_ball(phys::Circle &ball, const TargetState &target) const
{
    if (!target.has_ball)
        return;
    blend_toward(ball, target.ball_pos, target.ball_vel, ball_factor(phys::distance(ball.pos, target.ball_pos)));
}

} // namespace hax::sync
