// SPDX-License-Identifier: Apache-2.0
// match_state.hpp - Match configuration and the mutable state owned by the authoritative simulation
#pragma once
#include "input/bot_behavior.hpp"
#include "sim/map.hpp"
#include "sim/physics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hax::sim {

enum class KickMode : uint8_t
{
    classic, // impulse on press
    chargeable // charge while held, impulse on release
};

const char *kick_mode_name(KickMode m);
// Throws std::invalid_argument for anything other than classic|chargeable.
KickMode parse_kick_mode(std::string_view s);

struct BallConfig
{
    float radius{10.f};
    float mass{1.f};
    float damping{phys::kBallDamping};
    std::string color{"#FFFFFF"};
    std::string border_color{"#000000"};
    float border_width{2.f};
};

struct MatchConfig
{
    float time_limit_sec{0.f}; // 0 = unlimited
    uint32_t score_limit{0}; // 0 = unlimited
    uint32_t players_per_team{3};
    KickMode kick_mode{KickMode::classic};
    float kick_strength{phys::kKickStrength};
    float kick_speed_multiplier{0.5f}; // max speed factor while charging
    float player_radius{15.f};
    float player_mass{10.f};
    float player_speed{phys::kPlayerMaxSpeed};
    float player_acceleration{phys::kPlayerAcceleration};
    BallConfig ball;
    float goal_pause_sec{1.f};
};

struct PlayerInput
{
    bool up{false};
    bool down{false};
    bool left{false};
    bool right{false};
    bool kick{false};

    bool operator==(const PlayerInput &) const = default;
};

struct Player
{
    std::string id;
    std::string name;
    Team team{Team::spectator};
    phys::Circle circle;
    PlayerInput input;
    float kick_charge{0.f}; // [0,1]
    bool is_charging_kick{false};
    bool has_kicked_this_press{false};
    bool kick_held{false}; // kick flag seen on the previous step, for edge detection
    size_t spawn_index{0};
    std::optional<input::BotBehavior> bot;

    bool is_bot() const { return bot.has_value(); }
};

struct Ball
{
    phys::Circle circle;
    std::string last_touch_id;
};

struct Score
{
    uint32_t red{0};
    uint32_t blue{0};

    bool operator==(const Score &) const = default;
};

enum class Winner : uint8_t
{
    none,
    red,
    blue,
    draw
};

const char *winner_name(Winner w);

enum class Phase : uint8_t
{
    idle,
    running,
    goal_scored,
    finished
};

const char *phase_name(Phase p);

struct MatchState
{
    std::vector<Player> players;
    Ball ball;
    Score score;
    float time{0.f}; // elapsed match seconds
    bool running{false};
    bool finished{false};
    Winner winner{Winner::none};
    Phase phase{Phase::idle};
    float goal_countdown{0.f}; // > 0 while the post-goal pause is active

    Player *find_player(std::string_view id);
    const Player *find_player(std::string_view id) const;
};

} // namespace hax::sim
