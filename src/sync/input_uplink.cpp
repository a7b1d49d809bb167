// SPDX-License-Identifier: Apache-2.0
#include "sync/input_uplink.hpp"

namespace hax::sync {

std::optional<InputUpdate> InputUplink::on_step(const sim::PlayerInput &in, bool is_charging_kick, float kick_charge)
{
    ++m_tick;
    ++m_since_send;
    bool kick_edge = m_sent_any && in.kick != m_last.kick;
    bool changed = !m_sent_any || !(in == m_last);
    if (!changed && m_since_send < m_heartbeat_steps)
        return std::nullopt;
    m_last = in;
    m_sent_any = true;
    m_since_send = 0;
    return InputUpdate{m_tick, in, is_charging_kick, kick_charge, kick_edge};
}

} // namespace hax::sync
