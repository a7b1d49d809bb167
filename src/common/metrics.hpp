// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters (atomics, no dynamic allocation) for the match loop, transport and sync layer.
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace hax::metrics {

struct RuntimeCounters
{
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets for tick durations (base 62.5us) -> up to ~32ms.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // Fixed steps executed vs. frames where the accumulator had to be clamped.
    std::atomic<uint64_t> fixed_steps{0};
    std::atomic<uint64_t> clamped_frames{0};
    std::atomic<uint64_t> entity_faults{0};
    // Gauges
    std::atomic<uint64_t> active_matches{0};
    std::atomic<uint64_t> connected_participants{0};
    std::atomic<uint64_t> bots_in_match{0};
    // Match events
    std::atomic<uint64_t> goals_total{0};
    std::atomic<uint64_t> kicks_total{0};
    std::atomic<uint64_t> participants_left{0};
};

struct SnapshotCounters
{
    std::atomic<uint64_t> sent_bytes{0};
    std::atomic<uint64_t> sent_count{0};
    std::atomic<uint64_t> received_count{0};
    std::atomic<uint64_t> malformed_count{0};
};

struct SyncCounters
{
    std::atomic<uint64_t> reconcile_snaps{0};
    std::atomic<uint64_t> reconcile_blends{0};
    std::atomic<uint64_t> reconcile_skipped{0}; // inside dead zone
    std::atomic<uint64_t> local_kicks{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline SnapshotCounters &snapshot()
{
    static SnapshotCounters inst;
    return inst;
}

inline SyncCounters &sync()
{
    static SyncCounters inst;
    return inst;
}

// --- Tick duration histogram ---
inline constexpr uint64_t kTickBucketBaseNs = 62'500;

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (kTickBucketBaseNs << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the histogram bucket holding the 99th percentile.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return kTickBucketBaseNs << i;
    }
    return kTickBucketBaseNs << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline void add_snapshot_sent(uint64_t bytes)
{
    snapshot().sent_bytes.fetch_add(bytes, std::memory_order_relaxed);
    snapshot().sent_count.fetch_add(1, std::memory_order_relaxed);
}

inline void decrement(std::atomic<uint64_t> &gauge)
{
    auto cur = gauge.load(std::memory_order_relaxed);
    while (cur > 0 && !gauge.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
    }
}

// One-line JSON summary, logged periodically by the server and at shutdown.
inline std::string summary_json(const char *name)
{
    auto &rt = runtime();
    auto &sn = snapshot();
    auto &sy = sync();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
    uint64_t wait_samples = rt.wait_samples.load(std::memory_order_relaxed);
    uint64_t wait_mean_ns = wait_samples ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / wait_samples : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << name << "\"";
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << approx_tick_p99();
    j << ",\"wait_mean_ns\":" << wait_mean_ns;
    j << ",\"fixed_steps\":" << rt.fixed_steps.load(std::memory_order_relaxed);
    j << ",\"clamped_frames\":" << rt.clamped_frames.load(std::memory_order_relaxed);
    j << ",\"entity_faults\":" << rt.entity_faults.load(std::memory_order_relaxed);
    j << ",\"active_matches\":" << rt.active_matches.load(std::memory_order_relaxed);
    j << ",\"connected_participants\":" << rt.connected_participants.load(std::memory_order_relaxed);
    j << ",\"bots_in_match\":" << rt.bots_in_match.load(std::memory_order_relaxed);
    j << ",\"goals_total\":" << rt.goals_total.load(std::memory_order_relaxed);
    j << ",\"kicks_total\":" << rt.kicks_total.load(std::memory_order_relaxed);
    j << ",\"participants_left\":" << rt.participants_left.load(std::memory_order_relaxed);
    j << ",\"snapshot_bytes\":" << sn.sent_bytes.load(std::memory_order_relaxed);
    j << ",\"snapshot_count\":" << sn.sent_count.load(std::memory_order_relaxed);
    j << ",\"snapshot_received\":" << sn.received_count.load(std::memory_order_relaxed);
    j << ",\"snapshot_malformed\":" << sn.malformed_count.load(std::memory_order_relaxed);
    j << ",\"reconcile_snaps\":" << sy.reconcile_snaps.load(std::memory_order_relaxed);
    j << ",\"reconcile_blends\":" << sy.reconcile_blends.load(std::memory_order_relaxed);
    j << ",\"reconcile_skipped\":" << sy.reconcile_skipped.load(std::memory_order_relaxed);
    j << "}";
    return j.str();
}

} // namespace hax::metrics
