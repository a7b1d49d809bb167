// SPDX-License-Identifier: Apache-2.0
// input_source.hpp - Closed set of input producers consumed through one contract:
// direction(), kick_pressed(), advance(dt, sim_time, world), reset().
#pragma once
#include "input/bot_behavior.hpp"
#include "input/direction.hpp"
#include "input/replay.hpp"
#include "sim/map.hpp"
#include "sim/match_state.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace hax::input {

// Read-only view strategy sources use to pick a target. state/map may be null (no match yet).
struct WorldView
{
    const sim::MatchState *state{nullptr};
    const sim::GameMap *map{nullptr};
    std::string_view self_id;
};

// Human keys; the host (UI, network command, replay driver) feeds presses and releases.
class KeyboardInput
{
public:
    void set_key(Action a, bool down);
    // Applies only the keys that differ from the current state.
    void set_flags(const Flags &f);
    const Flags &flags() const { return m_keys; }
    Direction direction() const { return from_flags(m_keys); }
    bool kick_pressed() const { return m_keys.kick; }
    void advance(float dt, double sim_time, const WorldView &world);
    void reset();
    // Non-owning; the recorder must outlive this source or be detached with nullptr.
    void attach_recorder(ReplayRecorder *recorder) { m_recorder = recorder; }

private:
    Flags m_keys;
    double m_now_ms{0.0};
    ReplayRecorder *m_recorder{nullptr};
};

class IdleInput
{
public:
    explicit IdleInput(IdleBehavior b = {}) : m_behavior(b) {}
    Direction direction() const { return Direction::none; }
    bool kick_pressed() const { return m_kick; }
    void advance(float dt, double sim_time, const WorldView &world);
    void reset() { m_kick = false; }

private:
    IdleBehavior m_behavior;
    bool m_kick{false};
};

class PatrolInput
{
public:
    explicit PatrolInput(PatrolBehavior b);
    Direction direction() const { return m_direction; }
    bool kick_pressed() const { return m_kick; }
    void advance(float dt, double sim_time, const WorldView &world);
    void reset();
    bool finished() const { return m_finished; }
    size_t command_index() const { return m_index; }

private:
    void next_command();

    PatrolBehavior m_behavior;
    size_t m_index{0};
    float m_elapsed_ms{0.f};
    Direction m_direction{Direction::none};
    bool m_kick{false};
    bool m_finished{false};
};

class AutonomousInput
{
public:
    static constexpr float kDeadZone = 5.f;
    static constexpr float kAimOffset = 40.f;
    static constexpr float kDefaultMarkDistance = 50.f;
    static constexpr float kInterceptLookahead = 0.5f;
    static constexpr float kInterceptMinSpeed = 10.f;
    static constexpr float kAlignedCosine = 0.7f;

    explicit AutonomousInput(AutonomousBehavior b) : m_behavior(std::move(b)) {}
    Direction direction() const { return m_direction; }
    bool kick_pressed() const { return m_kick; }
    void advance(float dt, double sim_time, const WorldView &world);
    void reset();
    const AutonomousBehavior &behavior() const { return m_behavior; }

private:
    phys::Vec2 target_point(const sim::Player &self, const sim::MatchState &st, const sim::GameMap *map) const;

    AutonomousBehavior m_behavior;
    Direction m_direction{Direction::none};
    Direction m_pending{Direction::none};
    double m_pending_since{0.0};
    bool m_kick{false};
};

// Plays a recorded tape against simulated time. Seeking backwards restarts from the first event.
class ReplayInput
{
public:
    explicit ReplayInput(ReplayTape tape) : m_tape(std::move(tape)) {}
    Direction direction() const { return from_flags(m_keys); }
    bool kick_pressed() const { return m_keys.kick; }
    void advance(float dt, double sim_time, const WorldView &world);
    void reset();
    bool finished() const { return m_finished; }
    const Flags &flags() const { return m_keys; }

private:
    ReplayTape m_tape;
    Flags m_keys;
    size_t m_cursor{0};
    double m_last_ms{0.0};
    bool m_finished{false};
};

using InputSource = std::variant<KeyboardInput, IdleInput, PatrolInput, AutonomousInput, ReplayInput>;

Direction direction(const InputSource &src);
bool kick_pressed(const InputSource &src);
void advance(InputSource &src, float dt, double sim_time, const WorldView &world);
void reset(InputSource &src);
// Movement and kick flags as the physics consumes them.
sim::PlayerInput sample(const InputSource &src);
const char *source_kind(const InputSource &src);

InputSource make_bot_input(const BotBehavior &behavior);

} // namespace hax::input
