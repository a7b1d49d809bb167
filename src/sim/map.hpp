// SPDX-License-Identifier: Apache-2.0
// map.hpp - Static pitch geometry: walls, goals, goalposts and spawn points
#pragma once
#include "sim/physics.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hax::sim {

enum class Team
{
    spectator = 0,
    red = 1,
    blue = 2
};

const char *team_name(Team t);
// Throws std::invalid_argument for anything other than red|blue|spectator.
Team parse_team(std::string_view s);

inline Team opponent(Team t)
{
    return t == Team::red ? Team::blue : t == Team::blue ? Team::red : Team::spectator;
}

struct Goal
{
    phys::Vec2 p1;
    phys::Vec2 p2;
    Team team{Team::red}; // owner: a ball inside this goal scores for the opponent
};

struct SpawnPoints
{
    std::vector<phys::Vec2> red;
    std::vector<phys::Vec2> blue;
    phys::Vec2 ball;
};

struct GameMap
{
    std::string name;
    float width{1000.f};
    float height{600.f};
    std::vector<phys::Segment> segments;
    std::vector<Goal> goals;
    std::vector<phys::StaticCircle> goalposts;
    SpawnPoints spawns;

    // Segments that also stop players (outer boundary).
    std::vector<phys::Segment> player_segments() const;
    // Center of the goal owned by the opponent of team t (where t attacks).
    phys::Vec2 attacking_goal_center(Team t) const;
    phys::Vec2 spawn_for(Team t, size_t index_in_team) const;
};

inline constexpr float kGoalBoxMargin = 5.f;

// True when pos lies inside the goal box (goal line widened by kGoalBoxMargin on x).
bool inside_goal(const Goal &g, phys::Vec2 pos);

GameMap default_map();
GameMap classic_map();
// "default" | "classic"; throws std::invalid_argument otherwise.
GameMap map_by_name(std::string_view name);

} // namespace hax::sim
