// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Circle/segment collision engine integrated at a fixed timestep
#pragma once
#include <cmath>
#include <cstdint>
#include <optional>
#include <span>

namespace hax::phys {

// Velocities are in units per second; damping and acceleration are tuned per 1/60 s step
// and rescaled by dt * 60 so behavior does not depend on the step size.
inline constexpr float kPlayerAcceleration = 7.5f;
inline constexpr float kPlayerMaxSpeed = 150.f;
inline constexpr float kPlayerDamping = 0.96f;
inline constexpr float kBallDamping = 0.992f;
inline constexpr float kKickStrength = 500.f;
inline constexpr float kKickMargin = 15.f;
inline constexpr float kMaxSafeVelocity = 400.f;
inline constexpr float kCircleRestitution = 0.35f;
inline constexpr float kSegmentBounce = 0.9f;
inline constexpr float kGoalpostRadius = 8.f;
inline constexpr float kGoalpostBounce = 0.8f;
inline constexpr float kMinChargedKick = 0.2f;
// Sub-steps are sized so a circle never travels more than this fraction of its radius per sub-step.
inline constexpr float kSubstepRadiusFraction = 0.5f;
inline constexpr int kMaxSubsteps = 256;

struct Vec2
{
    float x{0.f};
    float y{0.f};
};

inline Vec2 operator+(Vec2 a, Vec2 b)
{
    return {a.x + b.x, a.y + b.y};
}

inline Vec2 operator-(Vec2 a, Vec2 b)
{
    return {a.x - b.x, a.y - b.y};
}

inline Vec2 operator*(Vec2 a, float s)
{
    return {a.x * s, a.y * s};
}

inline Vec2 &operator+=(Vec2 &a, Vec2 b)
{
    a.x += b.x;
    a.y += b.y;
    return a;
}

inline Vec2 &operator-=(Vec2 &a, Vec2 b)
{
    a.x -= b.x;
    a.y -= b.y;
    return a;
}

inline float dot(Vec2 a, Vec2 b)
{
    return a.x * b.x + a.y * b.y;
}

inline float length_sq(Vec2 v)
{
    return dot(v, v);
}

inline float length(Vec2 v)
{
    return std::sqrt(length_sq(v));
}

// Zero vector stays zero.
inline Vec2 normalize(Vec2 v)
{
    float len = length(v);
    if (len <= 0.f)
        return {0.f, 0.f};
    return {v.x / len, v.y / len};
}

inline float distance(Vec2 a, Vec2 b)
{
    return length(b - a);
}

inline Vec2 lerp(Vec2 a, Vec2 b, float t)
{
    return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

inline bool is_finite(Vec2 v)
{
    return std::isfinite(v.x) && std::isfinite(v.y);
}

struct Circle
{
    Vec2 pos;
    Vec2 vel;
    float radius{10.f};
    float mass{1.f};
    float inv_mass{1.f}; // 0 => immovable
    float damping{kBallDamping};
};

struct Segment
{
    Vec2 p1;
    Vec2 p2;
    Vec2 normal;
    float bounce{kSegmentBounce};
    bool player_collision{false};
};

// Immovable round obstacle (goalposts).
struct StaticCircle
{
    Vec2 pos;
    float radius{kGoalpostRadius};
    float bounce{kGoalpostBounce};
};

// Throws std::invalid_argument when radius <= 0. Mass <= 0 yields an immovable circle.
// Default damping: heavy circles (mass > 5) use player damping, light ones ball damping.
Circle create_circle(Vec2 pos, float radius, float mass, std::optional<float> damping = std::nullopt);

// Integrates position then applies damping^(dt*60).
void update_circle(Circle &c, float dt);

// Integrates in sub-steps so no sub-step moves the circle further than half its radius (and never faster
// than max_velocity per sub-step budget), resolving segment and static-circle contacts after each sub-step.
// Damping is applied once for the whole dt. Returns the peak normal impact speed seen during the step.
// Throws std::domain_error when the circle state is not finite.
float update_circle_with_substeps(
    Circle &c,
    float dt,
    std::span<const Segment> segments,
    std::span<const StaticCircle> posts = {},
    float max_velocity = kMaxSafeVelocity);

bool check_circle_collision(const Circle &a, const Circle &b);
// Separates both circles in proportion to inverse mass and applies an impulse along the contact normal.
// Coincident centers separate along +x.
void resolve_circle_collision(Circle &a, Circle &b, float restitution = kCircleRestitution);

Vec2 closest_point_on_segment(Vec2 p, const Segment &s);
bool check_segment_collision(const Circle &c, const Segment &s);
void resolve_segment_collision(Circle &c, const Segment &s);

bool check_static_circle_collision(const Circle &c, const StaticCircle &post);
void resolve_static_circle_collision(Circle &c, const StaticCircle &post);

// Speed of the velocity component pointing into a surface with the given outward normal.
float wall_impact_speed(Vec2 vel, Vec2 normal);

// Adds strength along the kicker->ball unit vector. Returns false (no impulse) when centers coincide.
bool apply_kick_impulse(const Circle &kicker, Circle &ball, float strength);

} // namespace hax::phys
