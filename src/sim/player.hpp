// SPDX-License-Identifier: Apache-2.0
// player.hpp - Per-player movement and kick rules shared by the authority and local prediction
#pragma once
#include "sim/match_state.hpp"

namespace hax::sim {

// Accelerates toward the input direction and clamps to the configured max speed (reduced while charging).
// Does not integrate position.
void apply_movement(Player &p, float dt, const MatchConfig &cfg);

// Kick press/hold/release handling for one step. strength_scale < 1 is used by local prediction.
// Returns true when an impulse was applied to the ball.
bool process_kick(Player &p, phys::Circle &ball, float dt, const MatchConfig &cfg, float strength_scale = 1.f);

// Kick while the kick key is held and the ball is in contact range. Returns true when an impulse fired.
bool try_contact_kick(Player &p, phys::Circle &ball, const MatchConfig &cfg, float strength_scale = 1.f);

// Applies a single kick impulse unless this press already kicked or the ball is farther than
// player radius + kick margin. charge is ignored in classic mode.
bool try_kick(Player &p, phys::Circle &ball, float charge, const MatchConfig &cfg, float strength_scale = 1.f);

phys::Circle make_player_circle(phys::Vec2 pos, const MatchConfig &cfg);
phys::Circle make_ball_circle(phys::Vec2 pos, const MatchConfig &cfg);

} // namespace hax::sim
