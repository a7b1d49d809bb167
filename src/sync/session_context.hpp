// SPDX-License-Identifier: Apache-2.0
// session_context.hpp - One match session as seen by one process: config, map, fixed-step clock,
// local input and the role chosen at construction. Any number of contexts may coexist.
#pragma once
#include "input/input_source.hpp"
#include "sim/fixed_step.hpp"
#include "sim/map.hpp"
#include "sim/match_state.hpp"
#include "sync/roles.hpp"

#include "game.pb.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hax::sync {

struct SessionOptions
{
    RoleKind role{RoleKind::authority};
    std::string local_player_id; // empty: nobody is controlled from this process
    float fixed_step{sim::kFixedStep};
    float extrapolation_ms{0.f}; // authority only
    uint32_t snapshot_interval_steps{1}; // authority only
    uint32_t input_heartbeat_steps{6}; // remote roles: ~100 ms at 60 Hz
};

using SnapshotSink = std::function<void(const wire::StateSnapshot &)>;
using InputSink = std::function<void(const InputUpdate &)>;

class SessionContext
{
public:
    SessionContext(sim::MatchConfig cfg, sim::GameMap map, SessionOptions opts);

    // Feeds one frame of real elapsed time; runs the fixed steps now due. Returns the number of steps.
    int tick(float frame_dt);
    // Remote roles merge the snapshot; ignored once stopped.
    void on_snapshot(const wire::StateSnapshot &snap);
    RenderView render_view() const;

    // Authority: installs the source on the local player inside the simulation.
    void set_local_input(input::InputSource src);
    input::InputSource *local_input();

    void pause();
    void resume();
    // Terminal: detaches the local input and the sinks, stops ticking and snapshot intake.
    void stop();
    bool paused() const { return m_paused; }
    bool stopped() const { return m_stopped; }

    void set_snapshot_sink(SnapshotSink sink) { m_snapshot_sink = std::move(sink); }
    void set_input_sink(InputSink sink) { m_input_sink = std::move(sink); }
    void emit_snapshot(const wire::StateSnapshot &snap);
    void emit_input(const InputUpdate &update);
    bool has_snapshot_sink() const { return static_cast<bool>(m_snapshot_sink); }

    RoleKind role_kind() const { return m_role->kind(); }
    TickRole &role() { return *m_role; }
    // nullptr unless this session is the authority.
    sim::Simulation *simulation();
    AuthorityRole *authority();
    RemoteRole *remote();
    const sim::MatchState &view_state() const { return m_role->view_state(); }

    const sim::MatchConfig &config() const { return m_cfg; }
    sim::MatchConfig &mutable_config() { return m_cfg; }
    const sim::GameMap &map() const { return m_map; }
    const SessionOptions &options() const { return m_opts; }
    const std::string &local_player_id() const { return m_opts.local_player_id; }
    const sim::FixedStepClock &clock() const { return m_clock; }
    uint64_t steps() const { return m_steps; }

private:
    sim::MatchConfig m_cfg;
    sim::GameMap m_map;
    SessionOptions m_opts;
    sim::FixedStepClock m_clock;
    std::unique_ptr<TickRole> m_role;
    std::optional<input::InputSource> m_local_input; // remote roles
    SnapshotSink m_snapshot_sink;
    InputSink m_input_sink;
    uint64_t m_steps{0};
    bool m_paused{false};
    bool m_stopped{false};
};

} // namespace hax::sync
