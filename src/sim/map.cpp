// SPDX-License-Identifier: Apache-2.0
#include "sim/map.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hax::sim {

const char *team_name(Team t)
{
    switch (t) {
        case Team::red:
            return "red";
        case Team::blue:
            return "blue";
        case Team::spectator:
            return "spectator";
    }
    return "spectator";
}

Team parse_team(std::string_view s)
{
    if (s == "red")
        return Team::red;
    if (s == "blue")
        return Team::blue;
    if (s == "spectator")
        return Team::spectator;
    throw std::invalid_argument("unknown team: " + std::string(s));
}

std::vector<phys::Segment> GameMap::player_segments() const
{
    std::vector<phys::Segment> out;
    std::copy_if(segments.begin(), segments.end(), std::back_inserter(out), [](const auto &s) {
        return s.player_collision;
    });
    return out;
}

phys::Vec2 GameMap::attacking_goal_center(Team t) const
{
    Team target_owner = opponent(t);
    for (const auto &g : goals) {
        if (g.team == target_owner)
            return phys::lerp(g.p1, g.p2, 0.5f);
    }
    return {width * 0.5f, height * 0.5f};
}

phys::Vec2 GameMap::spawn_for(Team t, size_t index_in_team) const
{
    const auto &pts = t == Team::red ? spawns.red : spawns.blue;
    if (pts.empty() || t == Team::spectator)
        return spawns.ball;
    return pts[index_in_team % pts.size()];
}

bool inside_goal(const Goal &g, phys::Vec2 pos)
{
    float min_x = std::min(g.p1.x, g.p2.x);
    float max_x = std::max(g.p1.x, g.p2.x);
    float min_y = std::min(g.p1.y, g.p2.y);
    float max_y = std::max(g.p1.y, g.p2.y);
    return pos.x >= min_x - kGoalBoxMargin && pos.x <= max_x + kGoalBoxMargin && pos.y >= min_y && pos.y <= max_y;
}

namespace {

// Builds a rectangular pitch inset by `inset` from a width x height arena, with goal openings on the
// left and right lines between goal_top and goal_bottom.
GameMap make_pitch(std::string name, float width, float height, float inset, float goal_top, float goal_bottom)
{
    GameMap m;
    m.name = std::move(name);
    m.width = width;
    m.height = height;
    constexpr float kWallBounce = 0.5f;
    // Outer boundary: stops players and ball.
    m.segments.push_back({{0.f, 0.f}, {width, 0.f}, {0.f, 1.f}, kWallBounce, true});
    m.segments.push_back({{width, 0.f}, {width, height}, {-1.f, 0.f}, kWallBounce, true});
    m.segments.push_back({{width, height}, {0.f, height}, {0.f, -1.f}, kWallBounce, true});
    m.segments.push_back({{0.f, height}, {0.f, 0.f}, {1.f, 0.f}, kWallBounce, true});
    const float left = inset;
    const float right = width - inset;
    const float top = inset;
    const float bottom = height - inset;
    // Pitch lines: ball only.
    m.segments.push_back({{left, top}, {right, top}, {0.f, 1.f}, kWallBounce, false});
    m.segments.push_back({{right, top}, {right, goal_top}, {-1.f, 0.f}, kWallBounce, false});
    m.segments.push_back({{right, goal_bottom}, {right, bottom}, {-1.f, 0.f}, kWallBounce, false});
    m.segments.push_back({{right, bottom}, {left, bottom}, {0.f, -1.f}, kWallBounce, false});
    m.segments.push_back({{left, bottom}, {left, goal_bottom}, {1.f, 0.f}, kWallBounce, false});
    m.segments.push_back({{left, goal_top}, {left, top}, {1.f, 0.f}, kWallBounce, false});
    m.goals.push_back({{left, goal_top}, {left, goal_bottom}, Team::red});
    m.goals.push_back({{right, goal_top}, {right, goal_bottom}, Team::blue});
    for (float x : {left, right}) {
        m.goalposts.push_back({{x, goal_top}, phys::kGoalpostRadius, phys::kGoalpostBounce});
        m.goalposts.push_back({{x, goal_bottom}, phys::kGoalpostRadius, phys::kGoalpostBounce});
    }
    m.spawns.ball = {width * 0.5f, height * 0.5f};
    return m;
}

} // namespace

GameMap default_map()
{
    GameMap m = make_pitch("default", 1000.f, 600.f, 50.f, 225.f, 375.f);
    m.spawns.red = {{200.f, 300.f}, {300.f, 200.f}, {300.f, 400.f}};
    m.spawns.blue = {{800.f, 300.f}, {700.f, 200.f}, {700.f, 400.f}};
    return m;
}

GameMap classic_map()
{
    GameMap m = make_pitch("classic", 1000.f, 600.f, 100.f, 240.f, 360.f);
    m.spawns.red = {{250.f, 300.f}, {350.f, 250.f}, {350.f, 350.f}};
    m.spawns.blue = {{750.f, 300.f}, {650.f, 250.f}, {650.f, 350.f}};
    return m;
}

GameMap map_by_name(std::string_view name)
{
    if (name == "default")
        return default_map();
    if (name == "classic")
        return classic_map();
    throw std::invalid_argument("unknown map: " + std::string(name));
}

} // namespace hax::sim
