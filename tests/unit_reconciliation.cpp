// SPDX-License-Identifier: Apache-2.0
// unit_reconciliation.cpp
// Snap, blend and dead-zone corrections of the predicted player.
#include "sync/reconciliation.hpp"

#include <cassert>
#include <iostream>

using namespace hax;
using sync::Correction;

static phys::Circle circle_at(phys::Vec2 pos)
{
    return phys::create_circle(pos, 15.f, 10.f, phys::kPlayerDamping);
}

static void test_snap()
{
    sync::Reconciler r;
    auto c = circle_at({100.f, 100.f});
    assert(r.on_snapshot(c, {300.f, 100.f}, {5.f, 0.f}) == Correction::snap);
    // Nothing moves until the next tick.
    assert(c.pos.x == 100.f);
    assert(r.active());
    assert(r.tick(c) == 0.f);
    assert(c.pos.x == 300.f && c.pos.y == 100.f);
    assert(c.vel.x == 5.f);
    assert(!r.active());
}

static void test_blend_converges()
{
    sync::Reconciler r;
    auto c = circle_at({100.f, 100.f});
    assert(r.on_snapshot(c, {130.f, 100.f}, {}) == Correction::blend);
    float prev = phys::distance(c.pos, {130.f, 100.f});
    int ticks = 0;
    while (r.active() && ticks < 200) {
        float residual = r.tick(c);
        float d = phys::distance(c.pos, {130.f, 100.f});
        assert(d == residual);
        assert(d < prev);
        prev = d;
        ++ticks;
    }
    assert(!r.active());
    assert(c.pos.x == 130.f);
    // 0.8^n * 30 drops below one pixel within a handful of ticks.
    assert(ticks < 60);
}

static void test_dead_zone()
{
    sync::Reconciler r;
    auto c = circle_at({100.f, 100.f});
    assert(r.on_snapshot(c, {102.f, 100.f}, {}) == Correction::none);
    assert(!r.active());
    assert(r.tick(c) == 0.f);
    assert(c.pos.x == 100.f);
}

static void test_dead_zone_cancels_running_blend()
{
    sync::Reconciler r;
    auto c = circle_at({0.f, 0.f});
    assert(r.on_snapshot(c, {10.f, 0.f}, {}) == Correction::blend);
    r.tick(c);
    assert(c.pos.x > 1.9f && c.pos.x < 2.1f);
    // The next authoritative position is within the dead zone of the prediction.
    assert(r.on_snapshot(c, {4.f, 0.f}, {}) == Correction::none);
    assert(!r.active());
    float x = c.pos.x;
    for (int i = 0; i < 40; ++i)
        assert(r.tick(c) == 0.f);
    assert(c.pos.x == x);
    assert(phys::distance(c.pos, {4.f, 0.f}) <= r.tuning().dead_zone);
}

static void test_later_snapshot_retargets_blend()
{
    sync::Reconciler r;
    auto c = circle_at({0.f, 0.f});
    assert(r.on_snapshot(c, {20.f, 0.f}, {}) == Correction::blend);
    r.tick(c);
    assert(r.on_snapshot(c, {0.f, 30.f}, {}) == Correction::blend);
    int ticks = 0;
    while (r.active() && ticks < 200) {
        r.tick(c);
        ++ticks;
    }
    assert(c.pos.x == 0.f && c.pos.y == 30.f);
}

static void test_dead_zone_keeps_pending_snap()
{
    sync::Reconciler r;
    auto c = circle_at({0.f, 0.f});
    assert(r.on_snapshot(c, {400.f, 0.f}, {}) == Correction::snap);
    assert(r.on_snapshot(c, {1.f, 0.f}, {}) == Correction::none);
    assert(r.pending() == Correction::snap);
    r.tick(c);
    assert(c.pos.x == 400.f);
}

static void test_snap_not_downgraded()
{
    sync::Reconciler r;
    auto c = circle_at({0.f, 0.f});
    assert(r.on_snapshot(c, {500.f, 0.f}, {}) == Correction::snap);
    assert(r.on_snapshot(c, {20.f, 0.f}, {}) == Correction::blend);
    assert(r.pending() == Correction::snap);
    r.tick(c);
    assert(c.pos.x == 20.f);
    r.reset();
    assert(!r.active());
}

static void test_custom_tuning()
{
    sync::ReconcileTuning t;
    t.snap_distance = 10.f;
    t.dead_zone = 1.f;
    sync::Reconciler r{t};
    auto c = circle_at({0.f, 0.f});
    assert(r.on_snapshot(c, {11.f, 0.f}, {}) == Correction::snap);
    sync::Reconciler r2{t};
    assert(r2.on_snapshot(c, {5.f, 0.f}, {}) == Correction::blend);
}

int main()
{
    test_snap();
    test_blend_converges();
    test_dead_zone();
    test_dead_zone_cancels_running_blend();
    test_later_snapshot_retargets_blend();
    test_dead_zone_keeps_pending_snap();
    test_snap_not_downgraded();
    test_custom_tuning();
    std::cout << "unit_reconciliation OK" << std::endl;
    return 0;
}
