// SPDX-License-Identifier: Apache-2.0
#include "input/direction.hpp"

#include <array>
#include <cmath>

namespace hax::input {

namespace {
constexpr float kDiag = 0.70710678f;

struct DirectionEntry
{
    Direction dir;
    const char *name;
};

constexpr std::array<DirectionEntry, 9> kDirections{{
    {Direction::none, "none"},
    {Direction::up, "up"},
    {Direction::down, "down"},
    {Direction::left, "left"},
    {Direction::right, "right"},
    {Direction::up_left, "up_left"},
    {Direction::up_right, "up_right"},
    {Direction::down_left, "down_left"},
    {Direction::down_right, "down_right"},
}};
} // namespace

phys::Vec2 to_vector(Direction d)
{
    switch (d) {
        case Direction::up:
            return {0.f, -1.f};
        case Direction::down:
            return {0.f, 1.f};
        case Direction::left:
            return {-1.f, 0.f};
        case Direction::right:
            return {1.f, 0.f};
        case Direction::up_left:
            return {-kDiag, -kDiag};
        case Direction::up_right:
            return {kDiag, -kDiag};
        case Direction::down_left:
            return {-kDiag, kDiag};
        case Direction::down_right:
            return {kDiag, kDiag};
        case Direction::none:
            break;
    }
    return {0.f, 0.f};
}

Direction from_angle(float degrees)
{
    float a = std::fmod(degrees, 360.f);
    if (a < 0.f)
        a += 360.f;
    // Sectors of 45 degrees centred on each compass direction, starting at "right".
    static constexpr std::array<Direction, 8> kSectors{
        Direction::right,
        Direction::down_right,
        Direction::down,
        Direction::down_left,
        Direction::left,
        Direction::up_left,
        Direction::up,
        Direction::up_right};
    int idx = static_cast<int>(std::floor((a + 22.5f) / 45.f)) % 8;
    return kSectors[static_cast<size_t>(idx)];
}

Direction from_vector(phys::Vec2 v, float dead_zone)
{
    if (phys::length(v) < dead_zone)
        return Direction::none;
    constexpr float kRadToDeg = 57.29577951f;
    return from_angle(std::atan2(v.y, v.x) * kRadToDeg);
}

Flags to_flags(Direction d, bool kick)
{
    Flags f;
    f.kick = kick;
    switch (d) {
        case Direction::up:
            f.up = true;
            break;
        case Direction::down:
            f.down = true;
            break;
        case Direction::left:
            f.left = true;
            break;
        case Direction::right:
            f.right = true;
            break;
        case Direction::up_left:
            f.up = f.left = true;
            break;
        case Direction::up_right:
            f.up = f.right = true;
            break;
        case Direction::down_left:
            f.down = f.left = true;
            break;
        case Direction::down_right:
            f.down = f.right = true;
            break;
        case Direction::none:
            break;
    }
    return f;
}

Direction from_flags(const Flags &f)
{
    int dx = (f.right ? 1 : 0) - (f.left ? 1 : 0);
    int dy = (f.down ? 1 : 0) - (f.up ? 1 : 0);
    if (dx == 0 && dy == 0)
        return Direction::none;
    if (dx == 0)
        return dy < 0 ? Direction::up : Direction::down;
    if (dy == 0)
        return dx < 0 ? Direction::left : Direction::right;
    if (dy < 0)
        return dx < 0 ? Direction::up_left : Direction::up_right;
    return dx < 0 ? Direction::down_left : Direction::down_right;
}

const char *direction_name(Direction d)
{
    for (const auto &e : kDirections)
        if (e.dir == d)
            return e.name;
    return "none";
}

std::optional<Direction> parse_direction(std::string_view s)
{
    for (const auto &e : kDirections)
        if (s == e.name)
            return e.dir;
    return std::nullopt;
}

const char *action_name(Action a)
{
    switch (a) {
        case Action::up:
            return "up";
        case Action::down:
            return "down";
        case Action::left:
            return "left";
        case Action::right:
            return "right";
        case Action::kick:
            return "kick";
    }
    return "kick";
}

std::optional<Action> parse_action(std::string_view s)
{
    if (s == "up")
        return Action::up;
    if (s == "down")
        return Action::down;
    if (s == "left")
        return Action::left;
    if (s == "right")
        return Action::right;
    if (s == "kick")
        return Action::kick;
    return std::nullopt;
}

} // namespace hax::input
