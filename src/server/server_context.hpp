// SPDX-License-Identifier: Apache-2.0
// server_context.hpp - State shared by the server coroutines of one process
#pragma once
#include "server/config.hpp"
#include "server/session/session_manager.hpp"

#include <atomic>
#include <string>

namespace hax::srv {

struct ServerContext
{
    ServerConfig config;
    SessionManager sessions;
    std::string match_id{"match_1"};
    std::atomic_bool shutdown{false};
    std::atomic_bool match_finished{false};

    explicit ServerContext(ServerConfig cfg) : config(std::move(cfg)) {}
};

} // namespace hax::srv
