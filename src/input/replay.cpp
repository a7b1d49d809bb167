// SPDX-License-Identifier: Apache-2.0
#include "input/replay.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace hax::input {

namespace {
uint32_t to_ms(double now_ms)
{
    if (!(now_ms > 0.0))
        return 0;
    return static_cast<uint32_t>(std::llround(now_ms));
}
} // namespace

void ReplayRecorder::begin(std::string player_id)
{
    m_tape = ReplayTape{};
    m_tape.player_id = std::move(player_id);
    m_recording = true;
}

void ReplayRecorder::record(double now_ms, Action action, bool pressed)
{
    if (!m_recording)
        return;
    uint32_t ts = to_ms(now_ms);
    if (!m_tape.events.empty())
        ts = std::max(ts, m_tape.events.back().timestamp_ms);
    m_tape.events.push_back({ts, action, pressed});
}

void ReplayRecorder::finish(double now_ms)
{
    if (!m_recording)
        return;
    m_tape.total_ms = to_ms(now_ms);
    if (!m_tape.events.empty())
        m_tape.total_ms = std::max(m_tape.total_ms, m_tape.events.back().timestamp_ms);
    m_recording = false;
}

wire::ReplayTape to_proto(const ReplayTape &tape)
{
    wire::ReplayTape msg;
    msg.set_player_id(tape.player_id);
    msg.set_total_ms(tape.total_ms);
    for (const auto &e : tape.events) {
        auto *out = msg.add_events();
        out->set_timestamp_ms(e.timestamp_ms);
        out->set_action(action_name(e.action));
        out->set_pressed(e.pressed);
    }
    return msg;
}

ReplayTape from_proto(const wire::ReplayTape &msg)
{
    ReplayTape tape;
    tape.player_id = msg.player_id();
    tape.total_ms = msg.total_ms();
    tape.events.reserve(static_cast<size_t>(msg.events_size()));
    for (const auto &e : msg.events()) {
        auto action = parse_action(e.action());
        if (!action) {
            log::warn("[replay] dropping event with unknown action '{}'", e.action());
            continue;
        }
        tape.events.push_back({e.timestamp_ms(), *action, e.pressed()});
    }
    std::stable_sort(tape.events.begin(), tape.events.end(), [](const ReplayEvent &a, const ReplayEvent &b) {
        return a.timestamp_ms < b.timestamp_ms;
    });
    return tape;
}

void save_tape(const std::string &path, const ReplayTape &tape)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("cannot open replay file for writing: " + path);
    if (!to_proto(tape).SerializeToOstream(&out))
        throw std::runtime_error("failed to write replay file: " + path);
}

ReplayTape load_tape(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("cannot open replay file: " + path);
    wire::ReplayTape msg;
    if (!msg.ParseFromIstream(&in))
        throw std::runtime_error("malformed replay file: " + path);
    return from_proto(msg);
}

} // namespace hax::input
