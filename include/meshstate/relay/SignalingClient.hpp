#pragma once

#include "meshstate/mesh/SignalingChannel.hpp"
#include "meshstate/relay/EventLoop.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace meshstate::relay {

struct SignalingClientConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{9750};
    std::string channel{"lobby"};
    std::size_t max_line_bytes{256u * 1024u};
};

// Client side of the RelayServer line protocol. The channel is open once the
// relay acknowledged JOIN.
class SignalingClient : public mesh::SignalingChannel {
public:
    SignalingClient(EventLoop& loop, SignalingClientConfig config);
    ~SignalingClient() override;

    SignalingClient(const SignalingClient&) = delete;
    SignalingClient& operator=(const SignalingClient&) = delete;

    // Starts a non-blocking connect. Returns false if no socket could be set up.
    bool connect();
    void close();

    State ready_state() const override { return state_; }
    void send(const std::string& payload) override;
    void set_message_handler(MessageHandler handler) override;
    void set_state_handler(StateHandler handler) override;

private:
    void on_event(std::uint32_t events);
    bool finish_connect();
    bool handle_read();
    bool handle_write();
    void handle_line(const std::string& line);
    void queue_line(const std::string& line);
    void update_interest();
    void shutdown(bool notify);
    void set_state(State state);

    EventLoop& loop_;
    SignalingClientConfig config_;
    int fd_{-1};
    bool connected_{false};
    State state_{State::Closed};
    std::string read_buffer_;
    std::string write_buffer_;
    MessageHandler message_handler_;
    StateHandler state_handler_;
};

}  // namespace meshstate::relay
