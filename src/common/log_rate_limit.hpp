// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite rate-limited logging. Emits every Nth invocation at the given level.
// Usage: HAX_LOG_EVERY_N(debug, 60, "[sync] snap player={} err={}", id, err);
// Reconciliation and prediction run once per fixed step (60 Hz), so unthrottled debug lines there
// would dominate the log.
#define HAX_LOG_EVERY_N(level, N, ...) \
    do { \
        static uint64_t _hax_log_counter_##__LINE__ = 0; \
        if ((++_hax_log_counter_##__LINE__ % (N)) == 0) { \
            hax::log::level(__VA_ARGS__); \
        } \
    } while (0)

// First invocation logs, then every Nth; used for one-off conditions that may repeat each tick.
#define HAX_LOG_FIRST_AND_EVERY_N(level, N, ...) \
    do { \
        static uint64_t _hax_log_first_counter_##__LINE__ = 0; \
        if ((_hax_log_first_counter_##__LINE__++ % (N)) == 0) { \
            hax::log::level(__VA_ARGS__); \
        } \
    } while (0)
