// SPDX-License-Identifier: Apache-2.0
// prediction.hpp - Local re-simulation of the controlled player on a remote participant
#pragma once
#include "sim/map.hpp"
#include "sim/match_state.hpp"

#include <string_view>

namespace hax::sync {

// Multipliers for the visual-only parts of prediction. Calibrated by feel, not derived.
struct PredictionTuning
{
    float ball_momentum_transfer{0.3f}; // share of the player's velocity handed to the ball on contact
    float local_kick_scale{0.7f}; // local kick strength relative to the authority's
};

// Advances the controlled player in the shadow state by one step: movement rules, kick edges at reduced
// strength, player walls, other players (last known circles) and a reduced ball response.
// Returns true when a local kick fired. No-op when the player is unknown or a spectator.
bool predict_local_player(
    sim::MatchState &shadow,
    std::string_view self_id,
    const sim::PlayerInput &input,
    const sim::MatchConfig &cfg,
    const sim::GameMap &map,
    float dt,
    const PredictionTuning &tuning = {});

// Partial ball physics: separates ball and player on contact, transfers a fraction of the player's
// momentum along the contact normal, then integrates the ball against the map.
void predict_local_ball(
    sim::Player &self, phys::Circle &ball, const sim::GameMap &map, float dt, const PredictionTuning &tuning = {});

} // namespace hax::sync
