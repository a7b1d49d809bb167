// SPDX-License-Identifier: Apache-2.0
// replay.hpp - Recorded human input tapes (timestamped press/release events) and their protobuf persistence
#pragma once
#include "input/direction.hpp"

#include "game.pb.h"

#include <cstdint>
#include <string>
#include <vector>

namespace hax::input {

struct ReplayEvent
{
    uint32_t timestamp_ms{0}; // simulated time since match start
    Action action{Action::kick};
    bool pressed{false};
};

struct ReplayTape
{
    std::string player_id;
    uint32_t total_ms{0};
    std::vector<ReplayEvent> events; // sorted by timestamp_ms
};

class ReplayRecorder
{
public:
    void begin(std::string player_id);
    // Ignored unless recording. Events arriving out of order are clamped to the last timestamp.
    void record(double now_ms, Action action, bool pressed);
    void finish(double now_ms);
    bool recording() const { return m_recording; }
    const ReplayTape &tape() const { return m_tape; }

private:
    ReplayTape m_tape;
    bool m_recording{false};
};

wire::ReplayTape to_proto(const ReplayTape &tape);
// Events with unknown action names are dropped; the remainder is stably sorted by timestamp.
ReplayTape from_proto(const wire::ReplayTape &msg);

// Both throw std::runtime_error on I/O or parse failure.
void save_tape(const std::string &path, const ReplayTape &tape);
ReplayTape load_tape(const std::string &path);

} // namespace hax::input
