#pragma once

#include "meshstate/relay/EventLoop.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace meshstate::relay {

struct RelayServerConfig {
    std::string listen_host{"0.0.0.0"};
    // 0 picks an ephemeral port; see RelayServer::port().
    std::uint16_t listen_port{9750};
    std::chrono::seconds ping_interval{30};
    std::size_t max_line_bytes{256u * 1024u};
    std::size_t max_pending_bytes{4u * 1024u * 1024u};
    // 0 means unlimited.
    std::size_t max_channel_members{0};
};

/**
 * Line-oriented signaling relay. A client joins one channel and every payload
 * it sends is delivered to the other members of that channel:
 *
 *   -> JOIN <channel>      <- OK | ERROR invalid-channel | ERROR channel-full
 *   -> LEAVE               <- OK
 *   -> SEND <payload>      (others) <- MSG <payload>
 *   <- PING                -> PONG
 *
 * Other protocol errors are answered with "ERROR <reason>". Oversized lines
 * and clients that stop reading are disconnected.
 */
class RelayServer {
public:
    RelayServer(EventLoop& loop, RelayServerConfig config);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool start();
    void stop();

    std::uint16_t port() const noexcept { return bound_port_; }
    std::size_t session_count() const noexcept { return sessions_.size(); }
    std::size_t channel_members(const std::string& channel) const;

private:
    struct ClientSession {
        explicit ClientSession(int fd);

        int fd{-1};
        std::string channel;
        std::string read_buffer;
        std::string write_buffer;
        bool closing{false};
    };

    using SessionPtr = std::shared_ptr<ClientSession>;

    void accept_pending();
    void on_client_event(const SessionPtr& session, std::uint32_t events);
    void read_from(const SessionPtr& session);
    void flush(const SessionPtr& session);
    void consume_lines(const SessionPtr& session);
    void handle_line(const SessionPtr& session, const std::string& line);
    void join(const SessionPtr& session, const std::string& channel);
    void forward(const SessionPtr& session, std::string_view payload);

    void queue_text(const SessionPtr& session, const std::string& text);
    void update_interest(const SessionPtr& session);
    void close_session(const SessionPtr& session);
    void leave_channel(const SessionPtr& session);
    void schedule_ping();

    EventLoop& loop_;
    RelayServerConfig config_{};
    int listen_fd_{-1};
    std::uint16_t bound_port_{0};
    std::optional<core::Scheduler::TimerId> ping_timer_;

    std::unordered_map<int, std::shared_ptr<ClientSession>> sessions_;
    std::unordered_map<std::string, std::set<int>> channels_;
};

}  // namespace meshstate::relay
