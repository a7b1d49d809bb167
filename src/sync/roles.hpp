// SPDX-License-Identifier: Apache-2.0
// roles.hpp - Per-session tick strategies: the authority simulates, remote roles follow snapshots
#pragma once
#include "sim/match_state.hpp"
#include "sim/simulation.hpp"
#include "sync/extrapolation.hpp"
#include "sync/input_uplink.hpp"
#include "sync/interpolation.hpp"
#include "sync/prediction.hpp"
#include "sync/reconciliation.hpp"
#include "sync/snapshot.hpp"

#include "game.pb.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hax::sync {

class SessionContext;

enum class RoleKind : uint8_t
{
    authority,
    predicting_participant,
    spectator // follows snapshots without predicting anything
};

const char *role_name(RoleKind k);

struct RenderEntity
{
    std::string id;
    std::string name;
    sim::Team team{sim::Team::spectator};
    phys::Vec2 pos;
    float radius{0.f};
    float kick_charge{0.f};
    bool is_charging_kick{false};
};

// Per-frame read-only projection handed to renderers and loggers.
struct RenderView
{
    std::vector<RenderEntity> players;
    phys::Vec2 ball;
    float ball_radius{0.f};
    sim::Score score;
    float time{0.f};
    bool running{false};
    bool finished{false};
    sim::Winner winner{sim::Winner::none};
};

class TickRole
{
public:
    virtual ~TickRole() = default;
    virtual RoleKind kind() const = 0;
    // One fixed step.
    virtual void step(SessionContext &ctx, float dt) = 0;
    virtual void on_snapshot(SessionContext &ctx, const wire::StateSnapshot &snap) = 0;
    virtual RenderView render_view(const SessionContext &ctx, float alpha) const = 0;
    // State the role currently shows: the authoritative state or the local shadow.
    virtual const sim::MatchState &view_state() const = 0;
};

class AuthorityRole : public TickRole
{
public:
    AuthorityRole(sim::MatchConfig cfg, sim::GameMap map, float extrapolation_ms, uint32_t snapshot_interval_steps);

    RoleKind kind() const override { return RoleKind::authority; }
    void step(SessionContext &ctx, float dt) override;
    void on_snapshot(SessionContext &ctx, const wire::StateSnapshot &snap) override;
    RenderView render_view(const SessionContext &ctx, float alpha) const override;
    const sim::MatchState &view_state() const override { return m_sim.state(); }

    sim::Simulation &simulation() { return m_sim; }
    const sim::Simulation &simulation() const { return m_sim; }
    Extrapolator &extrapolator() { return m_extrapolator; }
    uint32_t server_tick() const { return m_server_tick; }

private:
    void capture_previous();

    sim::Simulation m_sim;
    Extrapolator m_extrapolator;
    uint32_t m_snapshot_interval;
    uint32_t m_server_tick{0};
    std::unordered_map<std::string, phys::Vec2> m_prev_players;
    phys::Vec2 m_prev_ball;
    bool m_has_prev{false};
};

// Shared by the two snapshot-following roles: target bookkeeping, shadow state and interpolation.
class RemoteRole : public TickRole
{
public:
    explicit RemoteRole(uint32_t input_heartbeat_steps) : m_uplink(input_heartbeat_steps) {}

    void on_snapshot(SessionContext &ctx, const wire::StateSnapshot &snap) override;
    RenderView render_view(const SessionContext &ctx, float alpha) const override;
    const sim::MatchState &view_state() const override { return m_shadow; }
    const TargetState &target() const { return m_target; }
    sim::MatchState &shadow() { return m_shadow; }

protected:
    // Advances and samples the local input source; zero input when there is none.
    sim::PlayerInput sample_local(SessionContext &ctx, float dt);
    // Hands the sampled input to the uplink, which decides whether it goes upstream this step.
    void send_input(SessionContext &ctx, const sim::PlayerInput &in);
    virtual void after_snapshot(SessionContext &ctx) { (void)ctx; }

    sim::MatchState m_shadow;
    TargetState m_target;
    Interpolator m_interp;
    InputUplink m_uplink;
    double m_local_time{0.0};
};

class PredictingParticipantRole : public RemoteRole
{
public:
    explicit PredictingParticipantRole(
        uint32_t input_heartbeat_steps, PredictionTuning prediction = {}, ReconcileTuning reconcile = {})
        : RemoteRole(input_heartbeat_steps), m_prediction(prediction), m_reconciler(reconcile)
    {}

    RoleKind kind() const override { return RoleKind::predicting_participant; }
    void step(SessionContext &ctx, float dt) override;
    const Reconciler &reconciler() const { return m_reconciler; }

protected:
    void after_snapshot(SessionContext &ctx) override;

private:
    PredictionTuning m_prediction;
    Reconciler m_reconciler;
};

class SpectatorRole : public RemoteRole
{
public:
    using RemoteRole::RemoteRole;
    RoleKind kind() const override { return RoleKind::spectator; }
    void step(SessionContext &ctx, float dt) override;
};

} // namespace hax::sync
