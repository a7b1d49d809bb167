// SPDX-License-Identifier: Apache-2.0
#include "sync/prediction.hpp"

#include "common/metrics.hpp"
#include "sim/player.hpp"

#include <cmath>

namespace hax::sync {

bool predict_local_player(
    sim::MatchState &shadow,
    std::string_view self_id,
    const sim::PlayerInput &input,
    const sim::MatchConfig &cfg,
    const sim::GameMap &map,
    float dt,
    const PredictionTuning &tuning)
{
    sim::Player *self = shadow.find_player(self_id);
    if (!self || self->team == sim::Team::spectator)
        return false;
    self->input = input;
    sim::apply_movement(*self, dt, cfg);
    bool kicked = sim::process_kick(*self, shadow.ball.circle, dt, cfg, tuning.local_kick_scale);
    phys::update_circle(self->circle, dt);
    for (const auto &seg : map.segments) {
        if (seg.player_collision && phys::check_segment_collision(self->circle, seg))
            phys::resolve_segment_collision(self->circle, seg);
    }
    for (const auto &other : shadow.players) {
        if (&other == self || other.team == sim::Team::spectator)
            continue;
        // Other players are owned by interpolation; only the predicted player is pushed.
        phys::Circle obstacle = other.circle;
        if (phys::check_circle_collision(self->circle, obstacle))
            phys::resolve_circle_collision(self->circle, obstacle);
    }
    predict_local_ball(*self, shadow.ball.circle, map, dt, tuning);
    if (kicked)
        metrics::sync().local_kicks.fetch_add(1, std::memory_order_relaxed);
    return kicked;
}

void predict_local_ball(
    sim::Player &self, phys::Circle &ball, const sim::GameMap &map, float dt, const PredictionTuning &tuning)
{
    phys::Vec2 d = ball.pos - self.circle.pos;
    float min_dist = self.circle.radius + ball.radius;
    float dist_sq = phys::length_sq(d);
    if (dist_sq < min_dist * min_dist) {
        float dist = std::sqrt(dist_sq);
        phys::Vec2 n = dist > 0.f ? d * (1.f / dist) : phys::Vec2{1.f, 0.f};
        float overlap = min_dist - dist;
        ball.pos += n * (overlap * 0.5f);
        self.circle.pos -= n * (overlap * 0.5f);
        float push = phys::dot(self.circle.vel, n);
        if (push > 0.f)
            ball.vel += n * (push * tuning.ball_momentum_transfer);
    }
    phys::update_circle_with_substeps(ball, dt, map.segments, map.goalposts);
}

} // namespace hax::sync
