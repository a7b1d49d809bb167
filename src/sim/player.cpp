// SPDX-License-Identifier: Apache-2.0
#include "sim/player.hpp"

#include <algorithm>

namespace hax::sim {

void apply_movement(Player &p, float dt, const MatchConfig &cfg)
{
    phys::Vec2 dir{
        (p.input.right ? 1.f : 0.f) - (p.input.left ? 1.f : 0.f),
        (p.input.down ? 1.f : 0.f) - (p.input.up ? 1.f : 0.f)};
    dir = phys::normalize(dir);
    p.circle.vel += dir * (cfg.player_acceleration * dt * 60.f);
    float max_speed = cfg.player_speed * (p.is_charging_kick ? cfg.kick_speed_multiplier : 1.f);
    float speed = phys::length(p.circle.vel);
    if (speed > max_speed && speed > 0.f)
        p.circle.vel = p.circle.vel * (max_speed / speed);
}

bool try_kick(Player &p, phys::Circle &ball, float charge, const MatchConfig &cfg, float strength_scale)
{
    if (p.has_kicked_this_press)
        return false;
    float reach = p.circle.radius + phys::kKickMargin;
    if (phys::length_sq(ball.pos - p.circle.pos) > reach * reach)
        return false;
    float factor = cfg.kick_mode == KickMode::chargeable ? std::max(phys::kMinChargedKick, charge) : 1.f;
    if (!phys::apply_kick_impulse(p.circle, ball, cfg.kick_strength * factor * strength_scale))
        return false;
    p.has_kicked_this_press = true;
    return true;
}

bool process_kick(Player &p, phys::Circle &ball, float dt, const MatchConfig &cfg, float strength_scale)
{
    const bool pressed = p.input.kick && !p.kick_held;
    const bool released = !p.input.kick && p.kick_held;
    p.kick_held = p.input.kick;
    bool kicked = false;
    if (pressed) {
        p.is_charging_kick = true;
        p.kick_charge = 0.f;
        p.has_kicked_this_press = false;
        if (cfg.kick_mode == KickMode::classic)
            kicked = try_kick(p, ball, 1.f, cfg, strength_scale);
    } else if (p.input.kick && p.is_charging_kick && cfg.kick_mode == KickMode::chargeable) {
        p.kick_charge = std::min(1.f, p.kick_charge + dt);
    }
    if (released) {
        if (cfg.kick_mode == KickMode::chargeable && p.is_charging_kick)
            kicked = try_kick(p, ball, p.kick_charge, cfg, strength_scale);
        p.is_charging_kick = false;
        p.kick_charge = 0.f;
        p.has_kicked_this_press = false;
    }
    return kicked;
}

bool try_contact_kick(Player &p, phys::Circle &ball, const MatchConfig &cfg, float strength_scale)
{
    if (!p.is_charging_kick || p.has_kicked_this_press)
        return false;
    float charge = cfg.kick_mode == KickMode::chargeable ? p.kick_charge : 1.f;
    if (!try_kick(p, ball, charge, cfg, strength_scale))
        return false;
    p.is_charging_kick = false;
    p.kick_charge = 0.f;
    return true;
}

phys::Circle make_player_circle(phys::Vec2 pos, const MatchConfig &cfg)
{
    return phys::create_circle(pos, cfg.player_radius, cfg.player_mass, phys::kPlayerDamping);
}

phys::Circle make_ball_circle(phys::Vec2 pos, const MatchConfig &cfg)
{
    return phys::create_circle(pos, cfg.ball.radius, cfg.ball.mass, cfg.ball.damping);
}

} // namespace hax::sim
