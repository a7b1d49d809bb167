// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"
#include "input/direction.hpp"
#include "sim/map.hpp"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hax::srv {

struct Peer
{
    std::string connection_id;
    std::string player_id; // assigned on join
    std::string name;
    sim::Team team{sim::Team::spectator};
    bool joined{false};
    bool disconnected{false};
    std::chrono::steady_clock::time_point last_heartbeat{};

    struct InputState
    {
        input::Flags flags;
        uint64_t kick_presses{0}; // rising kick edges received
        uint64_t kick_presses_consumed{0}; // edges a fixed step has already seen
        uint32_t last_client_tick{0};
        bool is_charging_kick{false};
        float kick_charge{0.f};
    } input;

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for in-process peers
    std::vector<wire::ServerMessage> outgoing; // pending outbound messages

    Peer(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Peer(std::string cid) : connection_id(std::move(cid)) {}
};

struct LatchedInput
{
    input::Flags flags;
    uint64_t kick_presses{0};
};

struct JoinResult
{
    std::string player_id;
    sim::Team team{sim::Team::spectator};
};

struct ControlRequest
{
    wire::MatchControl::Action action{wire::MatchControl::PAUSE};
    std::string player_id;
};

// Peer bookkeeping shared by the listener, the heartbeat monitor and the match coroutine.
class SessionManager
{
public:
    std::shared_ptr<Peer> add_connection(coro::net::tcp::client client);
    // Peer without a socket (tests, in-process participants).
    std::shared_ptr<Peer> add_detached();

    // Assigns an id and a team: the preferred team while it has room, otherwise the other team, otherwise
    // spectator. nullopt picks the emptier team; spectator is honored as is. Joining twice returns the
    // first assignment.
    JoinResult join(
        const std::shared_ptr<Peer> &p,
        std::string name,
        std::optional<sim::Team> preferred,
        uint32_t players_per_team);
    // Slots taken by bots, counted when balancing teams.
    void set_reserved(uint32_t red, uint32_t blue);

    void push_message(const std::shared_ptr<Peer> &p, const wire::ServerMessage &msg);
    void broadcast(const wire::ServerMessage &msg);
    std::vector<wire::ServerMessage> drain_messages(const std::shared_ptr<Peer> &p);

    void update_heartbeat(const std::shared_ptr<Peer> &p);
    // Ignores commands older than the newest client_tick seen. A kick press stays latched until
    // consume_kick() confirms a simulation step ran with it.
    void update_input(const std::shared_ptr<Peer> &p, const wire::InputCommand &cmd);
    // Current flags with any latched kick press folded in. The latch is left in place.
    LatchedInput peek_input(const std::shared_ptr<Peer> &p);
    // Releases presses up to the count returned by peek_input; later presses stay latched.
    void consume_kick(const std::shared_ptr<Peer> &p, uint64_t presses);
    Peer::InputState get_input_copy(const std::shared_ptr<Peer> &p);

    void push_control(ControlRequest req);
    std::vector<ControlRequest> take_controls();

    std::vector<std::shared_ptr<Peer>> snapshot_peers();
    std::vector<std::shared_ptr<Peer>> joined_peers();
    // Peers joined / departed since the previous call (consumed by the match coroutine).
    std::vector<std::shared_ptr<Peer>> take_new_players();
    std::vector<std::string> take_departed();
    // Joined peers silent for longer than timeout.
    std::vector<std::shared_ptr<Peer>> expired(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout);

    void disconnect(const std::shared_ptr<Peer> &p);
    size_t size();

private:
    uint32_t team_count(sim::Team t) const; // caller holds m_mutex

    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    uint64_t m_player_counter{0};
    uint32_t m_reserved_red{0};
    uint32_t m_reserved_blue{0};
    std::unordered_map<std::string, std::shared_ptr<Peer>> m_by_connection;
    std::vector<std::shared_ptr<Peer>> m_new_players;
    std::vector<std::string> m_departed;
    std::vector<ControlRequest> m_controls;
};

} // namespace hax::srv
