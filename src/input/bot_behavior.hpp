// SPDX-License-Identifier: Apache-2.0
// bot_behavior.hpp - Declarative bot behavior descriptors (closed variant), loaded from config
#pragma once
#include "input/direction.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hax::input {

// Stands still; optionally kicks whenever the ball touches it.
struct IdleBehavior
{
    bool kick_on_contact{false};
};

struct PatrolCommand
{
    enum class Kind : uint8_t
    {
        move,
        kick,
        wait
    };
    Kind kind{Kind::wait};
    Direction direction{Direction::none}; // move only
    uint32_t duration_ms{0}; // move and wait; kick is instantaneous
};

struct PatrolBehavior
{
    std::vector<PatrolCommand> commands;
    bool loop{true};
};

enum class Strategy : uint8_t
{
    chase_ball,
    aim_at_goal,
    mark_player,
    intercept_ball,
    stay_at_position
};

struct AutonomousBehavior
{
    Strategy strategy{Strategy::chase_ball};
    std::string target_player_id; // mark_player
    std::optional<phys::Vec2> target_position; // stay_at_position
    std::optional<float> keep_distance; // stop this far from the target point
    float kick_distance{35.f};
    bool kick_when_aligned{false};
    uint32_t reaction_delay_ms{0};
};

using BotBehavior = std::variant<IdleBehavior, PatrolBehavior, AutonomousBehavior>;

const char *strategy_name(Strategy s);
std::optional<Strategy> parse_strategy(std::string_view s);
// "idle" | "patrol" | "autonomous"
const char *behavior_kind(const BotBehavior &b);

} // namespace hax::input
