// SPDX-License-Identifier: Apache-2.0
#include "sim/match_state.hpp"

#include <algorithm>
#include <stdexcept>

namespace hax::sim {

const char *kick_mode_name(KickMode m)
{
    return m == KickMode::chargeable ? "chargeable" : "classic";
}

KickMode parse_kick_mode(std::string_view s)
{
    if (s == "classic")
        return KickMode::classic;
    if (s == "chargeable")
        return KickMode::chargeable;
    throw std::invalid_argument("unknown kick mode: " + std::string(s));
}

const char *winner_name(Winner w)
{
    switch (w) {
        case Winner::red:
            return "red";
        case Winner::blue:
            return "blue";
        case Winner::draw:
            return "draw";
        case Winner::none:
            break;
    }
    return "none";
}

const char *phase_name(Phase p)
{
    switch (p) {
        case Phase::idle:
            return "idle";
        case Phase::running:
            return "running";
        case Phase::goal_scored:
            return "goal_scored";
        case Phase::finished:
            return "finished";
    }
    return "idle";
}

Player *MatchState::find_player(std::string_view id)
{
    auto it = std::find_if(players.begin(), players.end(), [&](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

const Player *MatchState::find_player(std::string_view id) const
{
    auto it = std::find_if(players.begin(), players.end(), [&](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

} // namespace hax::sim
