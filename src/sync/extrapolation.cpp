// SPDX-License-Identifier: Apache-2.0
#include "sync/extrapolation.hpp"

#include "sim/fixed_step.hpp"
#include "sim/player.hpp"

#include <algorithm>
#include <cmath>

namespace hax::sync {

void Extrapolator::set_horizon_ms(float ms)
{
    m_horizon_ms = std::isfinite(ms) ? std::clamp(ms, 0.f, kMaxExtrapolationMs) : 0.f;
}

const ProjectedPositions &Extrapolator::extrapolate(
    const sim::MatchState &st,
    const sim::GameMap &map,
    const sim::MatchConfig &cfg,
    const std::unordered_map<std::string, sim::PlayerInput> &inputs)
{
    std::vector<sim::Player> players = st.players;
    phys::Circle ball = st.ball.circle;
    for (auto &p : players) {
        auto it = inputs.find(p.id);
        p.input = it != inputs.end() ? it->second : sim::PlayerInput{};
        p.input.kick = false;
    }
    float remaining = m_horizon_ms / 1000.f;
    while (remaining > 1e-6f) {
        float h = std::min(remaining, sim::kFixedStep);
        remaining -= h;
        for (auto &p : players) {
            if (p.team == sim::Team::spectator)
                continue;
            sim::apply_movement(p, h, cfg);
            phys::update_circle(p.circle, h);
            for (const auto &seg : map.segments) {
                if (seg.player_collision && phys::check_segment_collision(p.circle, seg))
                    phys::resolve_segment_collision(p.circle, seg);
            }
        }
        phys::update_circle_with_substeps(ball, h, map.segments, map.goalposts);
        for (size_t i = 0; i < players.size(); ++i) {
            if (players[i].team == sim::Team::spectator)
                continue;
            for (size_t j = i + 1; j < players.size(); ++j) {
                if (players[j].team != sim::Team::spectator &&
                    phys::check_circle_collision(players[i].circle, players[j].circle))
                    phys::resolve_circle_collision(players[i].circle, players[j].circle);
            }
            if (phys::check_circle_collision(players[i].circle, ball))
                phys::resolve_circle_collision(players[i].circle, ball);
        }
    }

    if (m_has_current) {
        m_previous = std::move(m_current);
        m_has_previous = true;
    }
    m_current = ProjectedPositions{};
    m_current.ball = ball.pos;
    for (const auto &p : players)
        m_current.players.emplace(p.id, p.circle.pos);
    m_has_current = true;
    return m_current;
}

ProjectedPositions Extrapolator::project(float alpha) const
{
    if (!m_has_previous)
        return m_current;
    alpha = std::clamp(alpha, 0.f, 1.f);
    ProjectedPositions out;
    out.ball = phys::lerp(m_previous.ball, m_current.ball, alpha);
    for (const auto &[id, pos] : m_current.players) {
        auto it = m_previous.players.find(id);
        out.players.emplace(id, it != m_previous.players.end() ? phys::lerp(it->second, pos, alpha) : pos);
    }
    return out;
}

void Extrapolator::invalidate()
{
    m_previous = ProjectedPositions{};
    m_has_previous = false;
    m_has_current = false;
}

} // namespace hax::sync
