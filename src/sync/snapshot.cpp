// SPDX-License-Identifier: Apache-2.0
#include "sync/snapshot.hpp"

#include "common/log_rate_limit.hpp"
#include "common/metrics.hpp"
#include "sim/player.hpp"

#include <algorithm>
#include <cmath>

namespace hax::sync {

namespace {
void set_vec(wire::Vec2 *out, phys::Vec2 v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

// Absent or non-finite vectors read as zero.
phys::Vec2 read_vec(const wire::Vec2 &v, bool &malformed)
{
    phys::Vec2 out{v.x(), v.y()};
    if (!phys::is_finite(out)) {
        malformed = true;
        return {};
    }
    return out;
}

bool usable(float v)
{
    return std::isfinite(v) && v > 0.f;
}
} // namespace

wire::Team to_wire(sim::Team t)
{
    switch (t) {
        case sim::Team::red:
            return wire::TEAM_RED;
        case sim::Team::blue:
            return wire::TEAM_BLUE;
        case sim::Team::spectator:
            break;
    }
    return wire::TEAM_SPECTATOR;
}

sim::Team from_wire(wire::Team t)
{
    switch (t) {
        case wire::TEAM_RED:
            return sim::Team::red;
        case wire::TEAM_BLUE:
            return sim::Team::blue;
        default:
            return sim::Team::spectator;
    }
}

wire::Winner to_wire(sim::Winner w)
{
    switch (w) {
        case sim::Winner::red:
            return wire::WINNER_RED;
        case sim::Winner::blue:
            return wire::WINNER_BLUE;
        case sim::Winner::draw:
            return wire::WINNER_DRAW;
        case sim::Winner::none:
            break;
    }
    return wire::WINNER_NONE;
}

sim::Winner from_wire(wire::Winner w)
{
    switch (w) {
        case wire::WINNER_RED:
            return sim::Winner::red;
        case wire::WINNER_BLUE:
            return sim::Winner::blue;
        case wire::WINNER_DRAW:
            return sim::Winner::draw;
        default:
            return sim::Winner::none;
    }
}

wire::ConfigSubset build_config_subset(const sim::MatchConfig &cfg)
{
    wire::ConfigSubset out;
    out.set_kick_mode(cfg.kick_mode == sim::KickMode::chargeable ? wire::KICK_CHARGEABLE : wire::KICK_CLASSIC);
    out.set_kick_strength(cfg.kick_strength);
    out.set_ball_radius(cfg.ball.radius);
    out.set_ball_mass(cfg.ball.mass);
    out.set_ball_damping(cfg.ball.damping);
    out.set_player_speed(cfg.player_speed);
    out.set_player_acceleration(cfg.player_acceleration);
    out.set_kick_speed_multiplier(cfg.kick_speed_multiplier);
    return out;
}

void apply_config_subset(sim::MatchConfig &cfg, const wire::ConfigSubset &subset)
{
    cfg.kick_mode = subset.kick_mode() == wire::KICK_CHARGEABLE ? sim::KickMode::chargeable : sim::KickMode::classic;
    if (usable(subset.kick_strength()))
        cfg.kick_strength = subset.kick_strength();
    if (usable(subset.ball_radius()))
        cfg.ball.radius = subset.ball_radius();
    if (usable(subset.ball_mass()))
        cfg.ball.mass = subset.ball_mass();
    if (usable(subset.ball_damping()))
        cfg.ball.damping = subset.ball_damping();
    if (usable(subset.player_speed()))
        cfg.player_speed = subset.player_speed();
    if (usable(subset.player_acceleration()))
        cfg.player_acceleration = subset.player_acceleration();
    if (usable(subset.kick_speed_multiplier()))
        cfg.kick_speed_multiplier = subset.kick_speed_multiplier();
}

wire::StateSnapshot build_snapshot(const sim::MatchState &st, const sim::MatchConfig &cfg, uint32_t server_tick)
{
    wire::StateSnapshot snap;
    snap.set_server_tick(server_tick);
    for (const auto &p : st.players) {
        auto *ps = snap.add_players();
        ps->set_id(p.id);
        ps->set_name(p.name);
        ps->set_team(to_wire(p.team));
        set_vec(ps->mutable_pos(), p.circle.pos);
        set_vec(ps->mutable_vel(), p.circle.vel);
        ps->set_kick_charge(p.kick_charge);
        ps->set_is_charging_kick(p.is_charging_kick);
        ps->set_radius(p.circle.radius);
    }
    auto *ball = snap.mutable_ball();
    set_vec(ball->mutable_pos(), st.ball.circle.pos);
    set_vec(ball->mutable_vel(), st.ball.circle.vel);
    snap.mutable_score()->set_red(st.score.red);
    snap.mutable_score()->set_blue(st.score.blue);
    snap.set_time(st.time);
    snap.set_running(st.running);
    snap.set_finished(st.finished);
    snap.set_winner(to_wire(st.winner));
    *snap.mutable_config() = build_config_subset(cfg);
    return snap;
}

bool apply_snapshot(TargetState &target, const wire::StateSnapshot &snap)
{
    bool malformed = false;
    std::unordered_map<std::string, EntityTarget> players;
    players.reserve(static_cast<size_t>(snap.players_size()));
    for (const auto &ps : snap.players()) {
        if (ps.id().empty()) {
            malformed = true;
            continue;
        }
        EntityTarget et;
        et.name = ps.name();
        et.team = from_wire(ps.team());
        et.pos = read_vec(ps.pos(), malformed);
        et.vel = read_vec(ps.vel(), malformed);
        float charge = ps.kick_charge();
        et.kick_charge = std::isfinite(charge) ? std::clamp(charge, 0.f, 1.f) : 0.f;
        et.is_charging_kick = ps.is_charging_kick();
        et.radius = usable(ps.radius()) ? ps.radius() : 0.f;
        players.insert_or_assign(ps.id(), std::move(et));
    }
    target.players = std::move(players);
    if (snap.has_ball()) {
        target.ball_pos = read_vec(snap.ball().pos(), malformed);
        target.ball_vel = read_vec(snap.ball().vel(), malformed);
        target.has_ball = true;
    }
    target.server_tick = snap.server_tick();
    target.score = {snap.score().red(), snap.score().blue()};
    target.time = std::isfinite(snap.time()) ? snap.time() : target.time;
    target.running = snap.running();
    target.finished = snap.finished();
    target.winner = from_wire(snap.winner());
    ++target.applied;
    metrics::snapshot().received_count.fetch_add(1, std::memory_order_relaxed);
    if (malformed) {
        metrics::snapshot().malformed_count.fetch_add(1, std::memory_order_relaxed);
        HAX_LOG_FIRST_AND_EVERY_N(warn, 60, "[sync] malformed snapshot entries default-filled tick={}", snap.server_tick());
    }
    return !malformed;
}

void sync_roster(sim::MatchState &shadow, const TargetState &target, const sim::MatchConfig &cfg)
{
    std::erase_if(shadow.players, [&](const sim::Player &p) { return !target.players.contains(p.id); });
    for (const auto &[id, et] : target.players) {
        sim::Player *p = shadow.find_player(id);
        if (!p) {
            sim::Player np;
            np.id = id;
            np.circle = sim::make_player_circle(et.pos, cfg);
            np.circle.vel = et.vel;
            shadow.players.push_back(std::move(np));
            p = &shadow.players.back();
        }
        p->name = et.name;
        p->team = et.team;
        if (et.radius > 0.f)
            p->circle.radius = et.radius;
    }
    auto &ball = shadow.ball.circle;
    if (ball.radius != cfg.ball.radius || ball.mass != cfg.ball.mass || ball.damping != cfg.ball.damping) {
        phys::Vec2 vel = ball.vel;
        ball = sim::make_ball_circle(ball.pos, cfg);
        ball.vel = vel;
    }
    shadow.score = target.score;
    shadow.time = target.time;
    shadow.running = target.running;
    shadow.finished = target.finished;
    shadow.winner = target.winner;
    shadow.phase = target.finished ? sim::Phase::finished : target.running ? sim::Phase::running : sim::Phase::idle;
}

} // namespace hax::sync
