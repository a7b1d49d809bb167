// SPDX-License-Identifier: Apache-2.0
// config.hpp - Server configuration loaded from YAML
#pragma once
#include "input/bot_behavior.hpp"
#include "sim/map.hpp"
#include "sim/match_state.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace hax::srv {

struct BotSpec
{
    std::string name;
    sim::Team team{sim::Team::red};
    input::BotBehavior behavior{input::IdleBehavior{}};
};

struct ServerConfig
{
    uint16_t listen_port{40100};
    uint32_t tick_rate{60};
    uint32_t snapshot_interval_ticks{1};
    uint32_t peer_timeout_ms{5000};
    uint32_t heartbeat_check_ms{1000};
    std::string log_level{"info"};
    bool log_json{false};
    std::string map_name{"default"};
    sim::MatchConfig match;
    bool allow_remote_control{false};
    std::vector<BotSpec> bots;
};

// Missing keys keep their defaults. Throws YAML::Exception on type errors and std::invalid_argument on
// unknown enum values (team, kick mode, map, bot preset, strategy, direction).
ServerConfig parse_server_config(const YAML::Node &root);
ServerConfig load_server_config(const std::string &path);
// Match-level keys only (shared with tools that build a match without a server).
void apply_match_keys(sim::MatchConfig &cfg, const YAML::Node &root);
input::BotBehavior parse_bot_behavior(const YAML::Node &node);

} // namespace hax::srv
