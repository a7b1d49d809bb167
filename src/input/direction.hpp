// SPDX-License-Identifier: Apache-2.0
// direction.hpp - Nine-valued movement direction and conversions to vectors and key flags
#pragma once
#include "sim/physics.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace hax::input {

enum class Direction : uint8_t
{
    none,
    up,
    down,
    left,
    right,
    up_left,
    up_right,
    down_left,
    down_right
};

// Discrete actions a human (or a replay tape) can press and release.
enum class Action : uint8_t
{
    up,
    down,
    left,
    right,
    kick
};

struct Flags
{
    bool up{false};
    bool down{false};
    bool left{false};
    bool right{false};
    bool kick{false};

    bool operator==(const Flags &) const = default;
};

inline constexpr float kDirectionDeadZone = 0.1f;

// Unit vector for the direction (diagonals normalized); none -> zero. Screen coordinates: up is -y.
phys::Vec2 to_vector(Direction d);
// Nearest of the eight compass directions for an angle in degrees (0 = right, 90 = down).
Direction from_angle(float degrees);
// Direction of v, or none when |v| is below the dead zone.
Direction from_vector(phys::Vec2 v, float dead_zone = kDirectionDeadZone);
Flags to_flags(Direction d, bool kick = false);
// Opposite keys cancel each other.
Direction from_flags(const Flags &f);

const char *direction_name(Direction d);
std::optional<Direction> parse_direction(std::string_view s);
const char *action_name(Action a);
std::optional<Action> parse_action(std::string_view s);

} // namespace hax::input
