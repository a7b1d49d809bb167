// SPDX-License-Identifier: Apache-2.0
#include "sim/physics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace hax::phys {

Circle create_circle(Vec2 pos, float radius, float mass, std::optional<float> damping)
{
    if (!(radius > 0.f))
        throw std::invalid_argument("circle radius must be positive");
    Circle c{};
    c.pos = pos;
    c.radius = radius;
    c.mass = mass;
    c.inv_mass = mass > 0.f ? 1.f / mass : 0.f;
    c.damping = damping.value_or(mass > 5.f ? kPlayerDamping : kBallDamping);
    return c;
}

static void apply_damping(Circle &c, float dt)
{
    float factor = std::pow(c.damping, dt * 60.f);
    c.vel = c.vel * factor;
}

void update_circle(Circle &c, float dt)
{
    c.pos += c.vel * dt;
    apply_damping(c, dt);
}

float wall_impact_speed(Vec2 vel, Vec2 normal)
{
    return std::fabs(std::min(0.f, dot(vel, normal)));
}

float update_circle_with_substeps(
    Circle &c, float dt, std::span<const Segment> segments, std::span<const StaticCircle> posts, float max_velocity)
{
    if (!is_finite(c.pos) || !is_finite(c.vel))
        throw std::domain_error("non-finite circle state");
    float speed = length(c.vel);
    int substeps = 1;
    if (speed > 0.f) {
        float by_velocity = max_velocity > 0.f ? std::ceil(speed / max_velocity) : 1.f;
        float by_radius = std::ceil(speed * dt / (c.radius * kSubstepRadiusFraction));
        substeps = static_cast<int>(std::clamp(std::max(by_velocity, by_radius), 1.f, float(kMaxSubsteps)));
    }
    const float sub_dt = dt / static_cast<float>(substeps);
    float max_impact = 0.f;
    for (int i = 0; i < substeps; ++i) {
        c.pos += c.vel * sub_dt;
        for (const auto &seg : segments) {
            if (!check_segment_collision(c, seg))
                continue;
            Vec2 n = normalize(c.pos - closest_point_on_segment(c.pos, seg));
            if (length_sq(n) == 0.f)
                n = seg.normal;
            max_impact = std::max(max_impact, wall_impact_speed(c.vel, n));
            resolve_segment_collision(c, seg);
        }
        for (const auto &post : posts) {
            if (!check_static_circle_collision(c, post))
                continue;
            Vec2 n = normalize(c.pos - post.pos);
            max_impact = std::max(max_impact, wall_impact_speed(c.vel, n));
            resolve_static_circle_collision(c, post);
        }
    }
    apply_damping(c, dt);
    return max_impact;
}

bool check_circle_collision(const Circle &a, const Circle &b)
{
    float r = a.radius + b.radius;
    return length_sq(b.pos - a.pos) < r * r;
}

void resolve_circle_collision(Circle &a, Circle &b, float restitution)
{
    Vec2 d = b.pos - a.pos;
    float dist_sq = length_sq(d);
    float min_dist = a.radius + b.radius;
    if (dist_sq >= min_dist * min_dist)
        return;
    float inv_sum = a.inv_mass + b.inv_mass;
    if (inv_sum <= 0.f)
        return; // two immovable bodies
    float dist = std::sqrt(dist_sq);
    Vec2 n = dist > 0.f ? d * (1.f / dist) : Vec2{1.f, 0.f};
    float overlap = min_dist - dist;
    a.pos -= n * (overlap * a.inv_mass / inv_sum);
    b.pos += n * (overlap * b.inv_mass / inv_sum);
    float vn = dot(b.vel - a.vel, n);
    if (vn > 0.f)
        return; // already separating
    float j = -(1.f + restitution) * vn / inv_sum;
    a.vel -= n * (j * a.inv_mass);
    b.vel += n * (j * b.inv_mass);
}

Vec2 closest_point_on_segment(Vec2 p, const Segment &s)
{
    Vec2 dir = s.p2 - s.p1;
    float len_sq = length_sq(dir);
    if (len_sq == 0.f)
        return s.p1;
    float t = std::clamp(dot(p - s.p1, dir) / len_sq, 0.f, 1.f);
    return s.p1 + dir * t;
}

bool check_segment_collision(const Circle &c, const Segment &s)
{
    return length_sq(c.pos - closest_point_on_segment(c.pos, s)) < c.radius * c.radius;
}

void resolve_segment_collision(Circle &c, const Segment &s)
{
    Vec2 cp = closest_point_on_segment(c.pos, s);
    Vec2 delta = c.pos - cp;
    float dist = length(delta);
    if (dist >= c.radius)
        return;
    // Center exactly on the segment: push out along the segment's outward normal.
    Vec2 n = dist > 0.f ? delta * (1.f / dist) : s.normal;
    c.pos += n * (c.radius - dist);
    float vn = dot(c.vel, n);
    if (vn < 0.f)
        c.vel -= n * (vn * (1.f + s.bounce));
}

bool check_static_circle_collision(const Circle &c, const StaticCircle &post)
{
    float r = c.radius + post.radius;
    return length_sq(c.pos - post.pos) < r * r;
}

void resolve_static_circle_collision(Circle &c, const StaticCircle &post)
{
    Vec2 d = c.pos - post.pos;
    float dist = length(d);
    float min_dist = c.radius + post.radius;
    if (dist >= min_dist)
        return;
    Vec2 n = dist > 0.f ? d * (1.f / dist) : Vec2{1.f, 0.f};
    c.pos = post.pos + n * min_dist;
    float vn = dot(c.vel, n);
    if (vn < 0.f)
        c.vel -= n * (vn * (1.f + post.bounce));
}

bool apply_kick_impulse(const Circle &kicker, Circle &ball, float strength)
{
    Vec2 d = ball.pos - kicker.pos;
    float dist = length(d);
    if (dist <= 0.f)
        return false;
    ball.vel += d * (strength / dist);
    return true;
}

} // namespace hax::phys
