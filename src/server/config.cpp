// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace hax::srv {

namespace {
phys::Vec2 parse_point(const YAML::Node &n)
{
    if (!n.IsSequence() || n.size() != 2)
        throw std::invalid_argument("point must be a two-element sequence [x, y]");
    return {n[0].as<float>(), n[1].as<float>()};
}

input::PatrolCommand parse_patrol_command(const YAML::Node &n)
{
    input::PatrolCommand cmd;
    auto action = n["action"].as<std::string>();
    if (action == "move") {
        cmd.kind = input::PatrolCommand::Kind::move;
        auto dir = input::parse_direction(n["direction"].as<std::string>("none"));
        if (!dir)
            throw std::invalid_argument("unknown direction: " + n["direction"].as<std::string>());
        cmd.direction = *dir;
    } else if (action == "kick") {
        cmd.kind = input::PatrolCommand::Kind::kick;
    } else if (action == "wait") {
        cmd.kind = input::PatrolCommand::Kind::wait;
    } else {
        throw std::invalid_argument("unknown patrol action: " + action);
    }
    if (n["duration_ms"])
        cmd.duration_ms = n["duration_ms"].as<uint32_t>();
    return cmd;
}
} // namespace

input::BotBehavior parse_bot_behavior(const YAML::Node &node)
{
    if (!node)
        return input::IdleBehavior{};
    auto preset = node["preset"].as<std::string>("idle");
    if (preset == "idle") {
        input::IdleBehavior b;
        if (node["kick_on_contact"])
            b.kick_on_contact = node["kick_on_contact"].as<bool>();
        return b;
    }
    if (preset == "patrol") {
        input::PatrolBehavior b;
        if (node["loop"])
            b.loop = node["loop"].as<bool>();
        if (node["commands"]) {
            for (const auto &c : node["commands"])
                b.commands.push_back(parse_patrol_command(c));
        }
        return b;
    }
    if (preset == "autonomous") {
        input::AutonomousBehavior b;
        if (node["strategy"]) {
            auto s = input::parse_strategy(node["strategy"].as<std::string>());
            if (!s)
                throw std::invalid_argument("unknown strategy: " + node["strategy"].as<std::string>());
            b.strategy = *s;
        }
        if (node["target_player"])
            b.target_player_id = node["target_player"].as<std::string>();
        if (node["target"])
            b.target_position = parse_point(node["target"]);
        if (node["keep_distance"])
            b.keep_distance = node["keep_distance"].as<float>();
        if (node["kick_distance"])
            b.kick_distance = node["kick_distance"].as<float>();
        if (node["kick_when_aligned"])
            b.kick_when_aligned = node["kick_when_aligned"].as<bool>();
        if (node["reaction_delay_ms"])
            b.reaction_delay_ms = node["reaction_delay_ms"].as<uint32_t>();
        return b;
    }
    throw std::invalid_argument("unknown bot preset: " + preset);
}

void apply_match_keys(sim::MatchConfig &cfg, const YAML::Node &root)
{
    if (root["time_limit_sec"])
        cfg.time_limit_sec = root["time_limit_sec"].as<float>();
    if (root["score_limit"])
        cfg.score_limit = root["score_limit"].as<uint32_t>();
    if (root["players_per_team"])
        cfg.players_per_team = root["players_per_team"].as<uint32_t>();
    if (root["kick_mode"])
        cfg.kick_mode = sim::parse_kick_mode(root["kick_mode"].as<std::string>());
    if (root["kick_strength"])
        cfg.kick_strength = root["kick_strength"].as<float>();
    if (root["kick_speed_multiplier"])
        cfg.kick_speed_multiplier = root["kick_speed_multiplier"].as<float>();
    if (root["player_radius"])
        cfg.player_radius = root["player_radius"].as<float>();
    if (root["player_speed"])
        cfg.player_speed = root["player_speed"].as<float>();
    if (root["player_acceleration"])
        cfg.player_acceleration = root["player_acceleration"].as<float>();
    if (root["goal_pause_sec"])
        cfg.goal_pause_sec = root["goal_pause_sec"].as<float>();
    if (auto ball = root["ball"]) {
        if (ball["radius"])
            cfg.ball.radius = ball["radius"].as<float>();
        if (ball["mass"])
            cfg.ball.mass = ball["mass"].as<float>();
        if (ball["damping"])
            cfg.ball.damping = ball["damping"].as<float>();
        if (ball["color"])
            cfg.ball.color = ball["color"].as<std::string>();
        if (ball["border_color"])
            cfg.ball.border_color = ball["border_color"].as<std::string>();
        if (ball["border_width"])
            cfg.ball.border_width = ball["border_width"].as<float>();
    }
    if (!(cfg.player_radius > 0.f) || !(cfg.ball.radius > 0.f))
        throw std::invalid_argument("player_radius and ball.radius must be positive");
}

ServerConfig parse_server_config(const YAML::Node &root)
{
    ServerConfig cfg;
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["tick_rate"])
        cfg.tick_rate = root["tick_rate"].as<uint32_t>();
    if (root["snapshot_interval_ticks"])
        cfg.snapshot_interval_ticks = root["snapshot_interval_ticks"].as<uint32_t>();
    if (root["peer_timeout_ms"])
        cfg.peer_timeout_ms = root["peer_timeout_ms"].as<uint32_t>();
    if (root["heartbeat_check_ms"])
        cfg.heartbeat_check_ms = root["heartbeat_check_ms"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["map"]) {
        cfg.map_name = root["map"].as<std::string>();
        (void)sim::map_by_name(cfg.map_name); // validate early
    }
    if (root["allow_remote_control"])
        cfg.allow_remote_control = root["allow_remote_control"].as<bool>();
    apply_match_keys(cfg.match, root);
    if (root["bots"]) {
        for (const auto &b : root["bots"]) {
            BotSpec spec;
            spec.name = b["name"].as<std::string>("");
            spec.team = sim::parse_team(b["team"].as<std::string>("red"));
            spec.behavior = parse_bot_behavior(b["behavior"]);
            cfg.bots.push_back(std::move(spec));
        }
    }
    if (cfg.tick_rate == 0)
        throw std::invalid_argument("tick_rate must be positive");
    if (cfg.snapshot_interval_ticks == 0)
        cfg.snapshot_interval_ticks = 1;
    return cfg;
}

ServerConfig load_server_config(const std::string &path)
{
    return parse_server_config(YAML::LoadFile(path));
}

} // namespace hax::srv
