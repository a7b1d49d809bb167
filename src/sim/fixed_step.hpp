// SPDX-License-Identifier: Apache-2.0
// fixed_step.hpp - Frame-time accumulator driving the simulation at a fixed timestep
#pragma once
#include <cmath>

namespace hax::sim {

inline constexpr float kFixedStep = 1.f / 60.f;
inline constexpr float kMaxFrameTime = 0.1f;

class FixedStepClock
{
public:
    explicit FixedStepClock(float step = kFixedStep, float max_frame = kMaxFrameTime)
        : m_step(step), m_max_frame(max_frame)
    {}

    // Adds one frame's real elapsed time (clamped to max_frame; negative or non-finite ignored) and
    // returns how many fixed steps are now due. The remainder stays in the accumulator.
    int advance(float frame_dt)
    {
        m_clamped = false;
        if (!std::isfinite(frame_dt) || frame_dt <= 0.f)
            return 0;
        if (frame_dt > m_max_frame) {
            frame_dt = m_max_frame;
            m_clamped = true;
        }
        m_accumulator += frame_dt;
        int steps = 0;
        while (m_accumulator >= m_step) {
            m_accumulator -= m_step;
            ++steps;
        }
        return steps;
    }

    // Fraction of a step left over; render interpolation only.
    float alpha() const { return m_accumulator / m_step; }
    float step() const { return m_step; }
    bool last_frame_clamped() const { return m_clamped; }
    void reset() { m_accumulator = 0.f; }

private:
    float m_step;
    float m_max_frame;
    float m_accumulator{0.f};
    bool m_clamped{false};
};

} // namespace hax::sim
