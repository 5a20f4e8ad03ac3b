#include "meshstate/relay/SignalingClient.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/mesh/Transport.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace meshstate::relay {

namespace {

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

using daemon::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

bool resolve_ipv4(const std::string& host, std::uint16_t port, sockaddr_in& address) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return false;
    }
    address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);
    return true;
}

}  // namespace

SignalingClient::SignalingClient(EventLoop& loop, SignalingClientConfig config)
    : loop_(loop),
      config_(std::move(config)) {}

SignalingClient::~SignalingClient() {
    message_handler_ = nullptr;
    state_handler_ = nullptr;
    shutdown(false);
}

bool SignalingClient::connect() {
    if (fd_ >= 0) {
        return true;
    }

    sockaddr_in address{};
    if (!resolve_ipv4(config_.host, config_.port, address)) {
        log_event(StructuredLogger::Level::Error, "relay.client.resolve_failed", {{"host", config_.host}});
        return false;
    }

    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ < 0) {
        log_event(StructuredLogger::Level::Error, "relay.client.socket_failed", {{"error", std::strerror(errno)}});
        return false;
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }
    const int opts = ::fcntl(fd_, F_GETFD, 0);
    if (opts >= 0) {
        ::fcntl(fd_, F_SETFD, opts | FD_CLOEXEC);
    }

    const int rc = ::connect(fd_, reinterpret_cast<const sockaddr*>(&address), sizeof(address));
    if (rc < 0 && errno != EINPROGRESS) {
        log_event(StructuredLogger::Level::Error,
                  "relay.client.connect_failed",
                  {{"host", config_.host}, {"port", std::to_string(config_.port)}, {"error", std::strerror(errno)}});
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    connected_ = rc == 0;
    read_buffer_.clear();
    write_buffer_.clear();
    loop_.add(fd_, EventLoop::kEventReadable | EventLoop::kEventWritable, [this](int, std::uint32_t events) {
        on_event(events);
    });
    set_state(State::Connecting);
    if (fd_ >= 0) {
        queue_line("JOIN " + config_.channel);
    }
    return true;
}

void SignalingClient::close() {
    shutdown(true);
}

void SignalingClient::send(const std::string& payload) {
    if (state_ != State::Open) {
        throw mesh::TransportError("Signaling channel is not open");
    }
    if (payload.find('\n') != std::string::npos || payload.find('\r') != std::string::npos) {
        throw mesh::TransportError("Signaling payload must be a single line");
    }
    if (payload.size() + 5 > config_.max_line_bytes) {
        throw mesh::TransportError("Signaling payload exceeds " + std::to_string(config_.max_line_bytes) + " bytes");
    }
    queue_line("SEND " + payload);
}

void SignalingClient::set_message_handler(MessageHandler handler) {
    message_handler_ = std::move(handler);
}

void SignalingClient::set_state_handler(StateHandler handler) {
    state_handler_ = std::move(handler);
}

void SignalingClient::on_event(std::uint32_t events) {
    if (fd_ < 0) {
        return;
    }
    if (!connected_ && !finish_connect()) {
        return;
    }
    if (events & EventLoop::kEventError) {
        log_event(StructuredLogger::Level::Warning, "relay.client.disconnected", {{"channel", config_.channel}});
        shutdown(true);
        return;
    }
    if ((events & EventLoop::kEventReadable) && !handle_read()) {
        return;
    }
    if (events & EventLoop::kEventWritable) {
        handle_write();
    }
}

bool SignalingClient::finish_connect() {
    int error = 0;
    socklen_t length = sizeof(error);
    if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &length) != 0 || error != 0) {
        log_event(StructuredLogger::Level::Error,
                  "relay.client.connect_failed",
                  {{"host", config_.host},
                   {"port", std::to_string(config_.port)},
                   {"error", std::strerror(error != 0 ? error : errno)}});
        shutdown(true);
        return false;
    }
    connected_ = true;
    return true;
}

bool SignalingClient::handle_read() {
    std::array<char, 4096> buffer{};
    while (fd_ >= 0) {
        const auto received = ::recv(fd_, buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return true;
            }
            shutdown(true);
            return false;
        }
        if (received == 0) {
            log_event(StructuredLogger::Level::Info, "relay.client.closed_by_peer", {{"channel", config_.channel}});
            shutdown(true);
            return false;
        }
        read_buffer_.append(buffer.data(), static_cast<std::size_t>(received));

        std::size_t pos = 0;
        while (fd_ >= 0 && (pos = read_buffer_.find('\n')) != std::string::npos) {
            std::string line = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            handle_line(line);
        }
        if (fd_ >= 0 && read_buffer_.size() > config_.max_line_bytes) {
            log_event(StructuredLogger::Level::Warning,
                      "relay.client.line_too_long",
                      {{"bytes", std::to_string(read_buffer_.size())}});
            shutdown(true);
            return false;
        }
    }
    return false;
}

bool SignalingClient::handle_write() {
    while (fd_ >= 0 && !write_buffer_.empty()) {
        const auto sent = ::send(fd_, write_buffer_.data(), write_buffer_.size(), kSendFlags);
        if (sent < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            shutdown(true);
            return false;
        }
        write_buffer_.erase(0, static_cast<std::size_t>(sent));
    }
    update_interest();
    return fd_ >= 0;
}

void SignalingClient::handle_line(const std::string& line) {
    const auto space = line.find(' ');
    const std::string command = line.substr(0, space);
    const std::string argument = space == std::string::npos ? std::string{} : line.substr(space + 1);

    if (command == "OK") {
        if (state_ == State::Connecting) {
            log_event(StructuredLogger::Level::Info, "relay.client.joined", {{"channel", config_.channel}});
            set_state(State::Open);
        }
    } else if (command == "MSG") {
        if (auto handler = message_handler_) {
            handler(argument);
        }
    } else if (command == "PING") {
        queue_line("PONG");
    } else if (command == "PONG") {
        // Keep-alive acknowledgement.
    } else if (command == "ERROR") {
        log_event(StructuredLogger::Level::Warning,
                  "relay.client.error",
                  {{"channel", config_.channel}, {"reason", argument}});
        if (state_ == State::Connecting) {
            shutdown(true);
        }
    } else {
        log_event(StructuredLogger::Level::Warning, "relay.client.unknown_line", {{"command", command}});
    }
}

void SignalingClient::queue_line(const std::string& line) {
    write_buffer_.append(line);
    write_buffer_.push_back('\n');
    if (connected_) {
        handle_write();
    }
}

void SignalingClient::update_interest() {
    if (fd_ < 0) {
        return;
    }
    std::uint32_t mask = EventLoop::kEventReadable;
    if (!write_buffer_.empty() || !connected_) {
        mask |= EventLoop::kEventWritable;
    }
    loop_.update(fd_, mask);
}

void SignalingClient::shutdown(bool notify) {
    if (fd_ < 0) {
        return;
    }
    loop_.remove(fd_);
    ::close(fd_);
    fd_ = -1;
    connected_ = false;
    read_buffer_.clear();
    write_buffer_.clear();
    if (notify) {
        set_state(State::Closed);
    } else {
        state_ = State::Closed;
    }
}

void SignalingClient::set_state(State state) {
    if (state_ == state) {
        return;
    }
    state_ = state;
    if (auto handler = state_handler_) {
        handler(state);
    }
}

}  // namespace meshstate::relay
