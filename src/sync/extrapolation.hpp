// SPDX-License-Identifier: Apache-2.0
// extrapolation.hpp - Dead reckoning of render positions a short horizon ahead of the simulation
#pragma once
#include "sim/map.hpp"
#include "sim/match_state.hpp"

#include <string>
#include <unordered_map>

namespace hax::sync {

inline constexpr float kMaxExtrapolationMs = 500.f;

struct ProjectedPositions
{
    phys::Vec2 ball;
    std::unordered_map<std::string, phys::Vec2> players;
};

class Extrapolator
{
public:
    explicit Extrapolator(float horizon_ms = 0.f) { set_horizon_ms(horizon_ms); }

    // Clamped to [0, 500]; 0 disables look-ahead (positions pass through unchanged).
    void set_horizon_ms(float ms);
    float horizon_ms() const { return m_horizon_ms; }
    bool enabled() const { return m_horizon_ms > 0.f; }

    // Projects the state forward using each player's current input (controlled player and bots alike) with
    // the reduced physics; kicks are not simulated. Shifts the last output into the previous slot.
    const ProjectedPositions &extrapolate(
        const sim::MatchState &st,
        const sim::GameMap &map,
        const sim::MatchConfig &cfg,
        const std::unordered_map<std::string, sim::PlayerInput> &inputs);

    // Render blend between the previous and the latest output; the latest alone when no previous exists.
    ProjectedPositions project(float alpha) const;

    // Forget all output (positions were reset externally, or the match stopped moving).
    void invalidate();
    bool has_current() const { return m_has_current; }
    bool has_previous() const { return m_has_previous; }
    const ProjectedPositions &current() const { return m_current; }

private:
    float m_horizon_ms{0.f};
    ProjectedPositions m_current;
    ProjectedPositions m_previous;
    bool m_has_current{false};
    bool m_has_previous{false};
};

} // namespace hax::sync
