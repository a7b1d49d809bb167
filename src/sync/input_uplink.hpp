// SPDX-License-Identifier: Apache-2.0
// input_uplink.hpp - Decides when a remote participant sends its input upstream
#pragma once
#include "sim/match_state.hpp"

#include <cstdint>
#include <optional>

namespace hax::sync {

struct InputUpdate
{
    uint32_t client_tick{0};
    sim::PlayerInput input;
    bool is_charging_kick{false};
    float kick_charge{0.f};
    bool urgent{false}; // kick press or release
};

// Sends on change, on a bounded heartbeat and immediately on kick edges.
class InputUplink
{
public:
    explicit InputUplink(uint32_t heartbeat_steps = 6) : m_heartbeat_steps(heartbeat_steps == 0 ? 1 : heartbeat_steps) {}

    // Called once per fixed step with the sampled input. Returns the update to send, if any.
    std::optional<InputUpdate> on_step(const sim::PlayerInput &in, bool is_charging_kick, float kick_charge);
    uint32_t client_tick() const { return m_tick; }

private:
    uint32_t m_heartbeat_steps;
    uint32_t m_tick{0};
    uint32_t m_since_send{0};
    bool m_sent_any{false};
    sim::PlayerInput m_last;
};

} // namespace hax::sync
