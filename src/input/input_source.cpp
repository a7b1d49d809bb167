// SPDX-License-Identifier: Apache-2.0
#include "input/input_source.hpp"

#include <algorithm>
#include <type_traits>

namespace hax::input {

namespace {
void set_flag(Flags &f, Action a, bool down)
{
    switch (a) {
        case Action::up:
            f.up = down;
            break;
        case Action::down:
            f.down = down;
            break;
        case Action::left:
            f.left = down;
            break;
        case Action::right:
            f.right = down;
            break;
        case Action::kick:
            f.kick = down;
            break;
    }
}

bool get_flag(const Flags &f, Action a)
{
    switch (a) {
        case Action::up:
            return f.up;
        case Action::down:
            return f.down;
        case Action::left:
            return f.left;
        case Action::right:
            return f.right;
        case Action::kick:
            return f.kick;
    }
    return false;
}

constexpr Action kAllActions[] = {Action::up, Action::down, Action::left, Action::right, Action::kick};
} // namespace

// --- bot behavior names ---

const char *strategy_name(Strategy s)
{
    switch (s) {
        case Strategy::chase_ball:
            return "chase_ball";
        case Strategy::aim_at_goal:
            return "aim_at_goal";
        case Strategy::mark_player:
            return "mark_player";
        case Strategy::intercept_ball:
            return "intercept_ball";
        case Strategy::stay_at_position:
            return "stay_at_position";
    }
    return "chase_ball";
}

std::optional<Strategy> parse_strategy(std::string_view s)
{
    for (auto st : {Strategy::chase_ball,
                    Strategy::aim_at_goal,
                    Strategy::mark_player,
                    Strategy::intercept_ball,
                    Strategy::stay_at_position}) {
        if (s == strategy_name(st))
            return st;
    }
    return std::nullopt;
}

const char *behavior_kind(const BotBehavior &b)
{
    switch (b.index()) {
        case 0:
            return "idle";
        case 1:
            return "patrol";
        default:
            return "autonomous";
    }
}

// --- KeyboardInput ---

void KeyboardInput::set_key(Action a, bool down)
{
    if (get_flag(m_keys, a) == down)
        return;
    set_flag(m_keys, a, down);
    if (m_recorder)
        m_recorder->record(m_now_ms, a, down);
}

void KeyboardInput::set_flags(const Flags &f)
{
    for (Action a : kAllActions)
        set_key(a, get_flag(f, a));
}

void KeyboardInput::advance(float, double sim_time, const WorldView &)
{
    m_now_ms = sim_time * 1000.0;
}

void KeyboardInput::reset()
{
    m_keys = Flags{};
}

// --- IdleInput ---

void IdleInput::advance(float, double, const WorldView &world)
{
    m_kick = false;
    if (!m_behavior.kick_on_contact || !world.state)
        return;
    const auto *self = world.state->find_player(world.self_id);
    if (!self)
        return;
    const auto &ball = world.state->ball.circle;
    float reach = self->circle.radius + ball.radius + 5.f;
    m_kick = phys::length_sq(ball.pos - self->circle.pos) <= reach * reach;
}

// --- PatrolInput ---

PatrolInput::PatrolInput(PatrolBehavior b) : m_behavior(std::move(b))
{
    m_finished = m_behavior.commands.empty();
}

void PatrolInput::next_command()
{
    m_elapsed_ms = 0.f;
    ++m_index;
    if (m_index < m_behavior.commands.size())
        return;
    if (m_behavior.loop) {
        m_index = 0;
    } else {
        m_finished = true;
        m_direction = Direction::none;
    }
}

void PatrolInput::advance(float dt, double, const WorldView &)
{
    m_kick = false;
    if (m_finished)
        return;
    float budget = m_elapsed_ms + dt * 1000.f;
    // Bounded so a looping list of zero-length commands cannot spin forever.
    for (size_t guard = 0; guard <= m_behavior.commands.size() && !m_finished; ++guard) {
        const auto &cmd = m_behavior.commands[m_index];
        if (cmd.kind == PatrolCommand::Kind::kick) {
            m_kick = true;
            next_command();
            m_elapsed_ms = 0.f;
            return;
        }
        m_direction = cmd.kind == PatrolCommand::Kind::move ? cmd.direction : Direction::none;
        if (budget < static_cast<float>(cmd.duration_ms)) {
            m_elapsed_ms = budget;
            return;
        }
        budget -= static_cast<float>(cmd.duration_ms);
        next_command();
    }
    m_elapsed_ms = 0.f;
}

void PatrolInput::reset()
{
    m_index = 0;
    m_elapsed_ms = 0.f;
    m_direction = Direction::none;
    m_kick = false;
    m_finished = m_behavior.commands.empty();
}

// --- AutonomousInput ---

phys::Vec2 AutonomousInput::target_point(const sim::Player &self, const sim::MatchState &st, const sim::GameMap *map) const
{
    const auto &ball = st.ball.circle;
    switch (m_behavior.strategy) {
        case Strategy::chase_ball:
            return ball.pos;
        case Strategy::aim_at_goal: {
            phys::Vec2 goal = map ? map->attacking_goal_center(self.team) : ball.pos;
            phys::Vec2 behind = ball.pos - phys::normalize(goal - ball.pos) * kAimOffset;
            // Lined up behind the ball: push through it.
            if (phys::distance(self.circle.pos, behind) < kDeadZone * 2.f)
                return ball.pos;
            return behind;
        }
        case Strategy::mark_player: {
            const auto *target = st.find_player(m_behavior.target_player_id);
            if (!target)
                return ball.pos;
            float keep = m_behavior.keep_distance.value_or(kDefaultMarkDistance);
            return target->circle.pos + phys::normalize(ball.pos - target->circle.pos) * keep;
        }
        case Strategy::intercept_ball:
            if (phys::length(ball.vel) > kInterceptMinSpeed)
                return ball.pos + ball.vel * kInterceptLookahead;
            return ball.pos;
        case Strategy::stay_at_position:
            return m_behavior.target_position.value_or(self.circle.pos);
    }
    return ball.pos;
}

void AutonomousInput::advance(float, double sim_time, const WorldView &world)
{
    bool was_kicking = m_kick;
    m_kick = false;
    if (!world.state)
        return;
    const auto *self = world.state->find_player(world.self_id);
    if (!self)
        return;
    const auto &st = *world.state;
    phys::Vec2 target = target_point(*self, st, world.map);
    phys::Vec2 delta = target - self->circle.pos;
    float dist = phys::length(delta);
    bool keep_off = m_behavior.strategy != Strategy::mark_player && m_behavior.keep_distance &&
                    dist <= *m_behavior.keep_distance;
    Direction desired = (dist < kDeadZone || keep_off) ? Direction::none : from_vector(delta);

    if (m_behavior.reaction_delay_ms == 0) {
        m_direction = desired;
        m_pending = desired;
    } else {
        if (desired != m_pending) {
            m_pending = desired;
            m_pending_since = sim_time;
        }
        if ((sim_time - m_pending_since) * 1000.0 >= m_behavior.reaction_delay_ms)
            m_direction = m_pending;
    }

    const auto &ball = st.ball.circle;
    phys::Vec2 to_ball = ball.pos - self->circle.pos;
    bool want_kick = phys::length(to_ball) <= m_behavior.kick_distance;
    if (want_kick && m_behavior.kick_when_aligned && world.map) {
        phys::Vec2 to_goal = world.map->attacking_goal_center(self->team) - ball.pos;
        want_kick = phys::dot(phys::normalize(to_ball), phys::normalize(to_goal)) > kAlignedCosine;
    }
    // Release for one step between kicks so each press is a fresh edge.
    m_kick = want_kick && !was_kicking;
}

void AutonomousInput::reset()
{
    m_direction = Direction::none;
    m_pending = Direction::none;
    m_pending_since = 0.0;
    m_kick = false;
}

// --- ReplayInput ---

void ReplayInput::advance(float, double sim_time, const WorldView &)
{
    double now_ms = sim_time * 1000.0;
    if (now_ms < m_last_ms)
        reset();
    m_last_ms = now_ms;
    while (m_cursor < m_tape.events.size() && m_tape.events[m_cursor].timestamp_ms <= now_ms) {
        const auto &e = m_tape.events[m_cursor++];
        set_flag(m_keys, e.action, e.pressed);
    }
    m_finished = now_ms >= static_cast<double>(m_tape.total_ms);
}

void ReplayInput::reset()
{
    m_keys = Flags{};
    m_cursor = 0;
    m_last_ms = 0.0;
    m_finished = false;
}

// --- variant operations ---

Direction direction(const InputSource &src)
{
    return std::visit([](const auto &s) { return s.direction(); }, src);
}

bool kick_pressed(const InputSource &src)
{
    return std::visit([](const auto &s) { return s.kick_pressed(); }, src);
}

void advance(InputSource &src, float dt, double sim_time, const WorldView &world)
{
    std::visit([&](auto &s) { s.advance(dt, sim_time, world); }, src);
}

void reset(InputSource &src)
{
    std::visit([](auto &s) { s.reset(); }, src);
}

sim::PlayerInput sample(const InputSource &src)
{
    Flags f = to_flags(direction(src), kick_pressed(src));
    return sim::PlayerInput{f.up, f.down, f.left, f.right, f.kick};
}

const char *source_kind(const InputSource &src)
{
    static constexpr const char *kNames[] = {"keyboard", "idle", "patrol", "autonomous", "replay"};
    return kNames[src.index()];
}

InputSource make_bot_input(const BotBehavior &behavior)
{
    return std::visit(
        [](const auto &b) -> InputSource {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, IdleBehavior>)
                return IdleInput{b};
            else if constexpr (std::is_same_v<T, PatrolBehavior>)
                return PatrolInput{b};
            else
                return AutonomousInput{b};
        },
        behavior);
}

} // namespace hax::input
