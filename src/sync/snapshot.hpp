// SPDX-License-Identifier: Apache-2.0
// snapshot.hpp - Authority-side snapshot serialization and participant-side TargetState reshaping
#pragma once
#include "sim/match_state.hpp"

#include "game.pb.h"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace hax::sync {

struct EntityTarget
{
    std::string name;
    sim::Team team{sim::Team::spectator};
    phys::Vec2 pos;
    phys::Vec2 vel;
    float kick_charge{0.f};
    bool is_charging_kick{false};
    float radius{0.f}; // 0 => config default
};

// Latest authoritative snapshot keyed by id; what interpolation and reconciliation steer toward.
struct TargetState
{
    uint32_t server_tick{0};
    std::unordered_map<std::string, EntityTarget> players;
    bool has_ball{false};
    phys::Vec2 ball_pos;
    phys::Vec2 ball_vel;
    sim::Score score;
    float time{0.f};
    bool running{false};
    bool finished{false};
    sim::Winner winner{sim::Winner::none};
    uint64_t applied{0}; // snapshots merged so far
};

wire::ConfigSubset build_config_subset(const sim::MatchConfig &cfg);
// Copies the subset into cfg; zero / non-finite physical values leave the current setting untouched.
void apply_config_subset(sim::MatchConfig &cfg, const wire::ConfigSubset &subset);

wire::StateSnapshot build_snapshot(const sim::MatchState &st, const sim::MatchConfig &cfg, uint32_t server_tick);

// Merges a snapshot into target. Players without an id are skipped (counted as malformed); non-finite
// vectors become zero; an absent ball keeps the previous ball target. Players missing from the snapshot
// are dropped. Returns false when the snapshot carried malformed entries.
bool apply_snapshot(TargetState &target, const wire::StateSnapshot &snap);

// Adds players that appeared in target (placed at their target position) and removes those that left,
// so the shadow state mirrors the authoritative roster. Match flags and score are copied as well.
void sync_roster(sim::MatchState &shadow, const TargetState &target, const sim::MatchConfig &cfg);

wire::Team to_wire(sim::Team t);
sim::Team from_wire(wire::Team t);
wire::Winner to_wire(sim::Winner w);
sim::Winner from_wire(wire::Winner w);

} // namespace hax::sync
