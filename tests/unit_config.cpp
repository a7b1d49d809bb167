// SPDX-License-Identifier: Apache-2.0
// unit_config.cpp
// YAML server configuration: defaults, match keys, bot behaviors and rejected values.
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

using namespace hax;

template <typename Fn>
static bool throws_invalid(Fn fn)
{
    try {
        fn();
    } catch (const std::invalid_argument &) {
        return true;
    }
    return false;
}

static void test_defaults()
{
    auto cfg = srv::parse_server_config(YAML::Load("{}"));
    assert(cfg.listen_port == 40100);
    assert(cfg.tick_rate == 60);
    assert(cfg.snapshot_interval_ticks == 1);
    assert(cfg.map_name == "default");
    assert(!cfg.allow_remote_control);
    assert(cfg.bots.empty());
    assert(cfg.match.kick_mode == sim::KickMode::classic);
    assert(cfg.match.ball.damping == phys::kBallDamping);
}

static void test_match_keys()
{
    auto cfg = srv::parse_server_config(YAML::Load(R"(
listen_port: 41000
tick_rate: 30
snapshot_interval_ticks: 0
map: classic
time_limit_sec: 90
score_limit: 5
kick_mode: chargeable
kick_strength: 650
ball:
  radius: 12
  damping: 0.98
  color: "#FF0000"
)"));
    assert(cfg.listen_port == 41000);
    assert(cfg.tick_rate == 30);
    assert(cfg.snapshot_interval_ticks == 1); // zero means every tick
    assert(cfg.map_name == "classic");
    assert(cfg.match.time_limit_sec == 90.f);
    assert(cfg.match.score_limit == 5);
    assert(cfg.match.kick_mode == sim::KickMode::chargeable);
    assert(cfg.match.kick_strength == 650.f);
    assert(cfg.match.ball.radius == 12.f);
    assert(cfg.match.ball.mass == 1.f);
    assert(cfg.match.ball.color == "#FF0000");
}

static void test_bots()
{
    auto cfg = srv::parse_server_config(YAML::Load(R"(
bots:
  - name: wall
    team: blue
  - team: red
    behavior:
      preset: patrol
      loop: false
      commands:
        - { action: move, direction: up_left, duration_ms: 300 }
        - { action: kick }
        - { action: wait, duration_ms: 100 }
  - name: goalie
    team: blue
    behavior:
      preset: autonomous
      strategy: stay_at_position
      target: [910, 300]
      keep_distance: 4
      reaction_delay_ms: 90
  - name: shadow
    behavior:
      preset: autonomous
      strategy: mark_player
      target_player: p1
)"));
    assert(cfg.bots.size() == 4);
    assert(cfg.bots[0].name == "wall");
    assert(cfg.bots[0].team == sim::Team::blue);
    assert(std::holds_alternative<input::IdleBehavior>(cfg.bots[0].behavior));

    assert(cfg.bots[1].name.empty());
    const auto &patrol = std::get<input::PatrolBehavior>(cfg.bots[1].behavior);
    assert(!patrol.loop);
    assert(patrol.commands.size() == 3);
    assert(patrol.commands[0].direction == input::Direction::up_left);
    assert(patrol.commands[0].duration_ms == 300);
    assert(patrol.commands[1].kind == input::PatrolCommand::Kind::kick);
    assert(patrol.commands[2].kind == input::PatrolCommand::Kind::wait);

    const auto &goalie = std::get<input::AutonomousBehavior>(cfg.bots[2].behavior);
    assert(goalie.strategy == input::Strategy::stay_at_position);
    assert(goalie.target_position && goalie.target_position->x == 910.f);
    assert(goalie.keep_distance && *goalie.keep_distance == 4.f);
    assert(goalie.reaction_delay_ms == 90);

    const auto &marker = std::get<input::AutonomousBehavior>(cfg.bots[3].behavior);
    assert(marker.strategy == input::Strategy::mark_player);
    assert(marker.target_player_id == "p1");
    assert(cfg.bots[3].team == sim::Team::red);
}

static void test_rejects()
{
    assert(throws_invalid([] { srv::parse_server_config(YAML::Load("map: moon")); }));
    assert(throws_invalid([] { srv::parse_server_config(YAML::Load("kick_mode: volley")); }));
    assert(throws_invalid([] { srv::parse_server_config(YAML::Load("tick_rate: 0")); }));
    assert(throws_invalid([] { srv::parse_server_config(YAML::Load("player_radius: 0")); }));
    assert(throws_invalid([] { srv::parse_server_config(YAML::Load("bots: [{team: green}]")); }));
    assert(throws_invalid([] { srv::parse_bot_behavior(YAML::Load("{preset: dance}")); }));
    assert(throws_invalid([] { srv::parse_bot_behavior(YAML::Load("{preset: autonomous, strategy: teleport}")); }));
    assert(throws_invalid([] { srv::parse_bot_behavior(YAML::Load("{preset: autonomous, target: [1, 2, 3]}")); }));
    assert(throws_invalid(
        [] { srv::parse_bot_behavior(YAML::Load("{preset: patrol, commands: [{action: moonwalk}]}")); }));

    bool type_error = false;
    try {
        srv::parse_server_config(YAML::Load("listen_port: lots"));
    } catch (const YAML::Exception &) {
        type_error = true;
    }
    assert(type_error);
}

static void test_shipped_config()
{
    auto cfg = srv::load_server_config(std::string(HAX_SOURCE_DIR) + "/config/server.yaml");
    assert(cfg.tick_rate > 0);
    assert(!cfg.bots.empty());
    assert(cfg.match.score_limit > 0);
}

int main()
{
    test_defaults();
    test_match_keys();
    test_bots();
    test_rejects();
    test_shipped_config();
    std::cout << "unit_config OK" << std::endl;
    return 0;
}
