// SPDX-License-Identifier: Apache-2.0
#include "server/session/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <algorithm>

namespace hax::srv {

std::shared_ptr<Peer> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto p = std::make_shared<Peer>(cid, std::move(client));
    p->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, p);
    return p;
}

std::shared_ptr<Peer> SessionManager::add_detached()
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "local_" + std::to_string(++m_connection_counter);
    auto p = std::make_shared<Peer>(cid);
    p->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, p);
    return p;
}

uint32_t SessionManager::team_count(sim::Team t) const
{
    uint32_t n = t == sim::Team::red ? m_reserved_red : t == sim::Team::blue ? m_reserved_blue : 0;
    for (const auto &[cid, p] : m_by_connection) {
        if (p->joined && p->team == t)
            ++n;
    }
    return n;
}

JoinResult SessionManager::join(
    const std::shared_ptr<Peer> &p, std::string name, std::optional<sim::Team> preferred, uint32_t players_per_team)
{
    std::scoped_lock lk{m_mutex};
    if (p->joined)
        return {p->player_id, p->team};
    uint32_t red = team_count(sim::Team::red);
    uint32_t blue = team_count(sim::Team::blue);
    auto has_room = [&](sim::Team t) { return (t == sim::Team::red ? red : blue) < players_per_team; };
    sim::Team first = preferred.value_or(red <= blue ? sim::Team::red : sim::Team::blue);
    sim::Team team = sim::Team::spectator;
    if (first != sim::Team::spectator) {
        if (has_room(first))
            team = first;
        else if (has_room(sim::opponent(first)))
            team = sim::opponent(first);
    }
    p->player_id = "p" + std::to_string(++m_player_counter);
    p->name = name.empty() ? p->player_id : std::move(name);
    p->team = team;
    p->joined = true;
    p->last_heartbeat = std::chrono::steady_clock::now();
    m_new_players.push_back(p);
    metrics::runtime().connected_participants.fetch_add(1, std::memory_order_relaxed);
    log::info("[session] join id={} name={} team={}", p->player_id, p->name, sim::team_name(team));
    return {p->player_id, team};
}

void SessionManager::set_reserved(uint32_t red, uint32_t blue)
{
    std::scoped_lock lk{m_mutex};
    m_reserved_red = red;
    m_reserved_blue = blue;
}

void SessionManager::push_message(const std::shared_ptr<Peer> &p, const wire::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (p->disconnected)
        return;
    p->outgoing.push_back(msg);
}

void SessionManager::broadcast(const wire::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    for (auto &[cid, p] : m_by_connection) {
        if (p->joined && !p->disconnected)
            p->outgoing.push_back(msg);
    }
}

std::vector<wire::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Peer> &p)
{
    std::scoped_lock lk{m_mutex};
    std::vector<wire::ServerMessage> out;
    out.swap(p->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Peer> &p)
{
    std::scoped_lock lk{m_mutex};
    p->last_heartbeat = std::chrono::steady_clock::now();
}

void SessionManager::update_input(const std::shared_ptr<Peer> &p, const wire::InputCommand &cmd)
{
    std::scoped_lock lk{m_mutex};
    if (cmd.client_tick() < p->input.last_client_tick)
        return; // ignore old
    input::Flags next{cmd.up(), cmd.down(), cmd.left(), cmd.right(), cmd.kick()};
    bool changed = !(next == p->input.flags);
    if (next.kick && !p->input.flags.kick)
        ++p->input.kick_presses;
    p->input.flags = next;
    p->input.last_client_tick = cmd.client_tick();
    if (cmd.has_is_charging_kick())
        p->input.is_charging_kick = cmd.is_charging_kick();
    if (cmd.has_kick_charge())
        p->input.kick_charge = cmd.kick_charge();
    p->last_heartbeat = std::chrono::steady_clock::now();
    if (changed) {
        log::debug(
            "[input] player={} ctick={} up={} down={} left={} right={} kick={}",
            p->player_id,
            cmd.client_tick(),
            next.up,
            next.down,
            next.left,
            next.right,
            next.kick);
    }
}

LatchedInput SessionManager::peek_input(const std::shared_ptr<Peer> &p)
{
    std::scoped_lock lk{m_mutex};
    LatchedInput out{p->input.flags, p->input.kick_presses};
    if (p->input.kick_presses > p->input.kick_presses_consumed)
        out.flags.kick = true;
    return out;
}

void SessionManager::consume_kick(const std::shared_ptr<Peer> &p, uint64_t presses)
{
    std::scoped_lock lk{m_mutex};
    p->input.kick_presses_consumed = std::max(p->input.kick_presses_consumed, presses);
}

Peer::InputState SessionManager::get_input_copy(const std::shared_ptr<Peer> &p)
{
    std::scoped_lock lk{m_mutex};
    return p->input;
}

void SessionManager::push_control(ControlRequest req)
{
    std::scoped_lock lk{m_mutex};
    m_controls.push_back(std::move(req));
}

std::vector<ControlRequest> SessionManager::take_controls()
{
    std::scoped_lock lk{m_mutex};
    std::vector<ControlRequest> out;
    out.swap(m_controls);
    return out;
}

std::vector<std::shared_ptr<Peer>> SessionManager::snapshot_peers()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Peer>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

std::vector<std::shared_ptr<Peer>> SessionManager::joined_peers()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Peer>> res;
    for (auto &kv : m_by_connection) {
        if (kv.second->joined)
            res.push_back(kv.second);
    }
    return res;
}

std::vector<std::shared_ptr<Peer>> SessionManager::take_new_players()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Peer>> out;
    out.swap(m_new_players);
    return out;
}

std::vector<std::string> SessionManager::take_departed()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::string> out;
    out.swap(m_departed);
    return out;
}

std::vector<std::shared_ptr<Peer>> SessionManager::expired(
    std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Peer>> res;
    for (auto &[cid, p] : m_by_connection) {
        if (p->last_heartbeat.time_since_epoch().count() == 0)
            continue;
        if (now - p->last_heartbeat > timeout)
            res.push_back(p);
    }
    return res;
}

void SessionManager::disconnect(const std::shared_ptr<Peer> &p)
{
    std::scoped_lock lk{m_mutex};
    if (p->disconnected)
        return;
    p->disconnected = true;
    p->outgoing.clear();
    m_by_connection.erase(p->connection_id);
    m_new_players.erase(std::remove(m_new_players.begin(), m_new_players.end(), p), m_new_players.end());
    if (p->joined) {
        m_departed.push_back(p->player_id);
        metrics::decrement(metrics::runtime().connected_participants);
        metrics::runtime().participants_left.fetch_add(1, std::memory_order_relaxed);
        log::info("[session] left id={} conn={}", p->player_id, p->connection_id);
    }
}

size_t SessionManager::size()
{
    std::scoped_lock lk{m_mutex};
    return m_by_connection.size();
}

} // namespace hax::srv
