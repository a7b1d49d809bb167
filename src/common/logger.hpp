// SPDX-License-Identifier: Apache-2.0
// Asynchronous logger (header-only). A background thread drains the queue so neither the match
// coroutine nor the client frame loop waits on stderr. Messages follow the "[component] key=value"
// convention; the leading bracket tag becomes the "component" field in JSON mode.
// Environment:
//  - HAX_LOG_LEVEL  debug|info|warn|error (default info)
//  - HAX_LOG_JSON   any value: one JSON object per line
//  - HAX_LOG_APP_ID prefix identifying the process (also set_app_id)
//  - HAX_LOG_FILE   append to this file instead of stderr

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace hax::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

// Observer invoked on the consumer thread after each line is written.
using callback = void (*)(level lv, std::string_view component, std::string_view msg, void *user);

namespace detail {
struct item
{
    level lv;
    std::string msg;
    std::chrono::system_clock::time_point ts;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<bool> g_json{false};
inline std::atomic<bool> g_started{false};
inline std::atomic<bool> g_running{false};
inline std::atomic<uint64_t> g_enqueued{0};
inline std::atomic<uint64_t> g_written{0};
inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<item> g_queue;
inline std::mutex g_io_mtx; // guards g_app_id, g_file and the output streams
inline std::string g_app_id;
inline std::ofstream g_file;
inline std::atomic<callback> g_cb{nullptr};
inline std::atomic<void *> g_cb_user{nullptr};

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

// "[sync] snap err=4" -> component "sync", body "snap err=4". Untagged messages have no component.
inline std::pair<std::string_view, std::string_view> split_component(std::string_view m)
{
    if (m.size() < 3 || m.front() != '[')
        return {{}, m};
    auto close = m.find(']');
    if (close == std::string_view::npos || close == 1)
        return {{}, m};
    auto body = m.substr(close + 1);
    if (!body.empty() && body.front() == ' ')
        body.remove_prefix(1);
    return {m.substr(1, close - 1), body};
}

inline void append_json_string(std::string &out, std::string_view s)
{
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}
} // namespace detail

namespace detail_format {
template <typename T>
inline std::string to_string_any(const T &v)
{
    if constexpr (std::is_same_v<std::decay_t<T>, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_same_v<std::decay_t<T>, std::string>)
        return v;
    else if constexpr (std::is_same_v<std::decay_t<T>, const char *> || std::is_same_v<std::decay_t<T>, char *>)
        return v ? std::string(v) : std::string();
    else if constexpr (std::is_convertible_v<T, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_floating_point_v<T>) {
        // Positions and times are logged in world units; two decimals are plenty.
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << v;
        return oss.str();
    } else if constexpr (std::is_arithmetic_v<T>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Replaces each "{}" in order; surplus arguments are appended space-separated, surplus placeholders kept.
template <typename... Args>
inline std::string tiny_format(std::string_view fmt, Args &&...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        constexpr size_t N = sizeof...(Args);
        std::array<std::string, N> values{to_string_any(std::forward<Args>(args))...};
        std::string out;
        out.reserve(fmt.size() + N * 8);
        size_t pos = 0;
        size_t idx = 0;
        while (idx < N) {
            size_t p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[idx++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; idx < N; ++idx) {
            out.push_back(' ');
            out += values[idx];
        }
        return out;
    }
}
} // namespace detail_format

namespace detail {
inline std::string render_line(level lv, std::string_view m, std::chrono::system_clock::time_point tp)
{
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    char clock_buf[32];
    std::strftime(clock_buf, sizeof(clock_buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char ms_buf[8];
    std::snprintf(ms_buf, sizeof(ms_buf), ".%03d", static_cast<int>(ms));

    std::string line;
    if (g_json.load(std::memory_order_relaxed)) {
        auto [component, body] = split_component(m);
        line += "{\"ts\":\"";
        line += clock_buf;
        line += ms_buf;
        line += "\",\"level\":\"";
        line += level_name(lv);
        line += '"';
        if (!g_app_id.empty()) {
            line += ",\"app\":";
            append_json_string(line, g_app_id);
        }
        if (!component.empty()) {
            line += ",\"component\":";
            append_json_string(line, component);
        }
        line += ",\"msg\":";
        append_json_string(line, body);
        line += '}';
        return line;
    }
    const char *tag = lv == level::debug ? "D" : lv == level::info ? "I" : lv == level::warn ? "W" : "E";
    if (!g_app_id.empty()) {
        line += g_app_id;
        line += ' ';
    }
    line += '[';
    line += tag;
    line += ' ';
    line += clock_buf + 11; // time of day only
    line += ms_buf;
    line += "] ";
    line.append(m);
    return line;
}

inline void format_and_write(level lv, const std::string &m, std::chrono::system_clock::time_point tp)
{
    {
        std::lock_guard lk(g_io_mtx);
        std::string line = render_line(lv, m, tp);
        if (g_file.is_open())
            g_file << line << '\n' << std::flush;
        else
            std::cerr << line << std::endl;
    }
    if (auto cb = g_cb.load(std::memory_order_acquire)) {
        auto [component, body] = split_component(m);
        cb(lv, component, body, g_cb_user.load(std::memory_order_relaxed));
    }
}

inline std::thread g_thread;

inline void consumer_thread()
{
    while (true) {
        std::deque<item> local;
        {
            std::unique_lock lk(g_q_mtx);
            g_q_cv.wait(lk, [] { return !g_running.load(std::memory_order_acquire) || !g_queue.empty(); });
            if (g_queue.empty())
                break; // stopped and drained
            local.swap(g_queue);
        }
        for (auto &it : local) {
            format_and_write(it.lv, it.msg, it.ts);
            g_written.fetch_add(1, std::memory_order_release);
        }
    }
}

inline void stop()
{
    if (!g_running.exchange(false, std::memory_order_acq_rel))
        return;
    g_q_cv.notify_all();
    if (g_thread.joinable())
        g_thread.join();
}

inline void start()
{
    if (g_started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("HAX_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("HAX_LOG_JSON"))
        g_json.store(true, std::memory_order_relaxed);
    {
        std::lock_guard lk(g_io_mtx);
        if (const char *app = std::getenv("HAX_LOG_APP_ID"); app && *app && g_app_id.empty())
            g_app_id.assign(app);
        if (const char *path = std::getenv("HAX_LOG_FILE"); path && *path) {
            g_file.open(path, std::ios::app);
            if (!g_file)
                std::cerr << "cannot open HAX_LOG_FILE " << path << ", logging to stderr" << std::endl;
        }
    }
    g_running.store(true, std::memory_order_release);
    g_thread = std::thread([] { consumer_thread(); });
    std::atexit([] { stop(); });
}
} // namespace detail

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::g_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    std::lock_guard lk(detail::g_io_mtx);
    detail::g_app_id = std::move(id);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

inline void set_callback(callback cb, void *user) noexcept
{
    detail::g_cb_user.store(user, std::memory_order_release);
    detail::g_cb.store(cb, std::memory_order_release);
}

// Blocks until everything queued so far has been written.
inline void flush()
{
    if (!detail::g_running.load(std::memory_order_acquire))
        return;
    const uint64_t target = detail::g_enqueued.load(std::memory_order_acquire);
    while (detail::g_written.load(std::memory_order_acquire) < target && detail::g_running.load(std::memory_order_acquire))
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto tp = std::chrono::system_clock::now();
    if (detail::g_running.load(std::memory_order_acquire)) {
        {
            std::lock_guard lk(detail::g_q_mtx);
            detail::g_queue.push_back(detail::item{lv, std::string(msg), tp});
            detail::g_enqueued.fetch_add(1, std::memory_order_release);
        }
        detail::g_q_cv.notify_one();
    } else {
        // after exit-time shutdown
        detail::format_and_write(lv, std::string(msg), tp);
    }
}

inline void debug(std::string_view m)
{
    write(level::debug, m);
}

inline void info(std::string_view m)
{
    write(level::info, m);
}

inline void warn(std::string_view m)
{
    write(level::warn, m);
}

inline void error(std::string_view m)
{
    write(level::error, m);
}

template <typename... Args>
inline void debug(const char *fmt, Args &&...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void info(const char *fmt, Args &&...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void warn(const char *fmt, Args &&...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(const char *fmt, Args &&...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::tiny_format(fmt, std::forward<Args>(args)...));
}

} // namespace hax::log
