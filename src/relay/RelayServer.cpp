#include "meshstate/relay/RelayServer.hpp"

#include "meshstate/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace meshstate::relay {

namespace {

constexpr std::size_t kMaxChannelName = 64;
constexpr std::size_t kReadChunk = 4096;

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

enum class Command { Join, Leave, Send, Ping, Pong, Unknown };

struct ParsedLine {
    Command command{Command::Unknown};
    std::string_view argument;
};

ParsedLine parse_line(std::string_view line) {
    const auto space = line.find(' ');
    const auto word = line.substr(0, space);
    ParsedLine parsed{};
    if (space != std::string_view::npos) {
        parsed.argument = line.substr(space + 1);
    }
    if (word == "JOIN") {
        parsed.command = Command::Join;
    } else if (word == "LEAVE") {
        parsed.command = Command::Leave;
    } else if (word == "SEND") {
        parsed.command = Command::Send;
    } else if (word == "PING") {
        parsed.command = Command::Ping;
    } else if (word == "PONG") {
        parsed.command = Command::Pong;
    }
    return parsed;
}

bool is_valid_channel(std::string_view name) {
    return !name.empty() && name.size() <= kMaxChannelName &&
           std::all_of(name.begin(), name.end(), [](unsigned char ch) {
               return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.';
           });
}

void make_nonblocking(int fd) {
    const int status = ::fcntl(fd, F_GETFL, 0);
    if (status >= 0) {
        ::fcntl(fd, F_SETFL, status | O_NONBLOCK);
    }
    const int descriptor = ::fcntl(fd, F_GETFD, 0);
    if (descriptor >= 0) {
        ::fcntl(fd, F_SETFD, descriptor | FD_CLOEXEC);
    }
}

bool would_block() {
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

// Returns a listening socket bound to host:port, or -1 after logging why.
int open_listener(const std::string& host, std::uint16_t port) {
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        log_event(StructuredLogger::Level::Error, "relay.server.invalid_host", {{"host", host}});
        return -1;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        log_event(StructuredLogger::Level::Error, "relay.server.socket_failed", {{"error", std::strerror(errno)}});
        return -1;
    }
    const int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    make_nonblocking(fd);

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0 ||
        ::listen(fd, SOMAXCONN) != 0) {
        log_event(StructuredLogger::Level::Error,
                  "relay.server.bind_failed",
                  {{"host", host}, {"port", std::to_string(port)}, {"error", std::strerror(errno)}});
        ::close(fd);
        return -1;
    }
    return fd;
}

std::uint16_t local_port(int fd, std::uint16_t fallback) {
    sockaddr_in bound{};
    socklen_t length = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &length) != 0) {
        return fallback;
    }
    return ntohs(bound.sin_port);
}

}  // namespace

RelayServer::ClientSession::ClientSession(int socket_fd)
    : fd(socket_fd) {}

RelayServer::RelayServer(EventLoop& loop, RelayServerConfig config)
    : loop_(loop),
      config_(std::move(config)) {}

RelayServer::~RelayServer() {
    stop();
}

bool RelayServer::start() {
    listen_fd_ = open_listener(config_.listen_host, config_.listen_port);
    if (listen_fd_ < 0) {
        return false;
    }
    bound_port_ = local_port(listen_fd_, config_.listen_port);

    loop_.add(listen_fd_, EventLoop::kEventReadable, [this](int, std::uint32_t) { accept_pending(); });
    schedule_ping();

    log_event(StructuredLogger::Level::Info,
              "relay.server.listening",
              {{"host", config_.listen_host}, {"port", std::to_string(bound_port_)}});
    return true;
}

void RelayServer::stop() {
    if (ping_timer_) {
        loop_.cancel(*ping_timer_);
        ping_timer_.reset();
    }
    if (listen_fd_ >= 0) {
        loop_.remove(listen_fd_);
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    std::vector<SessionPtr> open;
    open.reserve(sessions_.size());
    for (const auto& [fd, session] : sessions_) {
        open.push_back(session);
    }
    for (const auto& session : open) {
        close_session(session);
    }
    channels_.clear();
}

std::size_t RelayServer::channel_members(const std::string& channel) const {
    const auto it = channels_.find(channel);
    return it == channels_.end() ? 0 : it->second.size();
}

void RelayServer::accept_pending() {
    for (;;) {
        const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (!would_block() && errno != EINTR) {
                log_event(StructuredLogger::Level::Warning, "relay.server.accept_failed", {{"error", std::strerror(errno)}});
            }
            return;
        }
        make_nonblocking(client_fd);
        auto session = std::make_shared<ClientSession>(client_fd);
        sessions_.emplace(client_fd, session);
        loop_.add(client_fd, EventLoop::kEventReadable,
                  [this, weak = std::weak_ptr<ClientSession>(session)](int fd, std::uint32_t events) {
                      if (auto locked = weak.lock()) {
                          on_client_event(locked, events);
                      } else {
                          loop_.remove(fd);
                      }
                  });
    }
}

void RelayServer::on_client_event(const SessionPtr& session, std::uint32_t events) {
    if (events & EventLoop::kEventError) {
        close_session(session);
        return;
    }
    if (events & EventLoop::kEventReadable) {
        read_from(session);
    }
    if (!session->closing && (events & EventLoop::kEventWritable)) {
        flush(session);
    }
}

void RelayServer::read_from(const SessionPtr& session) {
    char chunk[kReadChunk];
    while (!session->closing) {
        const auto received = ::recv(session->fd, chunk, sizeof(chunk), 0);
        if (received > 0) {
            session->read_buffer.append(chunk, static_cast<std::size_t>(received));
            consume_lines(session);
            continue;
        }
        if (received < 0 && would_block()) {
            return;
        }
        // Orderly shutdown or a hard error.
        close_session(session);
        return;
    }
}

void RelayServer::flush(const SessionPtr& session) {
    std::size_t offset = 0;
    while (offset < session->write_buffer.size()) {
        const auto sent = ::send(session->fd,
                                 session->write_buffer.data() + offset,
                                 session->write_buffer.size() - offset,
                                 kSendFlags);
        if (sent < 0) {
            if (would_block()) {
                break;
            }
            close_session(session);
            return;
        }
        offset += static_cast<std::size_t>(sent);
    }
    session->write_buffer.erase(0, offset);
    update_interest(session);
}

void RelayServer::consume_lines(const SessionPtr& session) {
    std::size_t start = 0;
    while (!session->closing) {
        const auto newline = session->read_buffer.find('\n', start);
        const std::size_t length = (newline == std::string::npos ? session->read_buffer.size() : newline) - start;
        if (length > config_.max_line_bytes) {
            log_event(StructuredLogger::Level::Warning,
                      "relay.server.line_too_long",
                      {{"fd", std::to_string(session->fd)}, {"bytes", std::to_string(length)}});
            close_session(session);
            return;
        }
        if (newline == std::string::npos) {
            break;
        }
        std::string_view line(session->read_buffer.data() + start, length);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        // Copied: handlers may append to or clear the session buffers.
        const std::string owned(line);
        start = newline + 1;
        handle_line(session, owned);
    }
    if (!session->closing) {
        session->read_buffer.erase(0, start);
    }
}

void RelayServer::handle_line(const SessionPtr& session, const std::string& line) {
    if (line.empty()) {
        return;
    }
    const auto parsed = parse_line(line);
    switch (parsed.command) {
        case Command::Join:
            join(session, std::string(parsed.argument));
            break;
        case Command::Leave:
            leave_channel(session);
            queue_text(session, "OK\n");
            break;
        case Command::Send:
            forward(session, parsed.argument);
            break;
        case Command::Ping:
            queue_text(session, "PONG\n");
            break;
        case Command::Pong:
            break;
        case Command::Unknown:
            queue_text(session, "ERROR unknown-command\n");
            break;
    }
}

void RelayServer::join(const SessionPtr& session, const std::string& channel) {
    if (!is_valid_channel(channel)) {
        queue_text(session, "ERROR invalid-channel\n");
        return;
    }
    if (session->channel == channel) {
        queue_text(session, "OK\n");
        return;
    }
    if (config_.max_channel_members > 0 && channel_members(channel) >= config_.max_channel_members) {
        log_event(StructuredLogger::Level::Warning,
                  "relay.server.channel_full",
                  {{"channel", channel}, {"limit", std::to_string(config_.max_channel_members)}});
        queue_text(session, "ERROR channel-full\n");
        return;
    }
    leave_channel(session);
    session->channel = channel;
    auto& members = channels_[channel];
    members.insert(session->fd);
    queue_text(session, "OK\n");
    log_event(StructuredLogger::Level::Info,
              "relay.server.joined",
              {{"channel", channel}, {"members", std::to_string(members.size())}});
}

void RelayServer::forward(const SessionPtr& session, std::string_view payload) {
    if (session->channel.empty()) {
        queue_text(session, "ERROR not-joined\n");
        return;
    }
    const auto members = channels_.find(session->channel);
    if (members == channels_.end()) {
        return;
    }
    std::string line;
    line.reserve(payload.size() + 5);
    line.append("MSG ").append(payload).push_back('\n');

    // queue_text may close a slow member, which edits the member set.
    const std::vector<int> targets(members->second.begin(), members->second.end());
    for (const int fd : targets) {
        if (fd == session->fd) {
            continue;
        }
        if (const auto target = sessions_.find(fd); target != sessions_.end()) {
            queue_text(target->second, line);
        }
    }
}

void RelayServer::queue_text(const SessionPtr& session, const std::string& text) {
    if (session->closing) {
        return;
    }
    if (session->write_buffer.size() + text.size() > config_.max_pending_bytes) {
        log_event(StructuredLogger::Level::Warning,
                  "relay.server.slow_consumer",
                  {{"fd", std::to_string(session->fd)}, {"pending", std::to_string(session->write_buffer.size())}});
        close_session(session);
        return;
    }
    session->write_buffer += text;
    update_interest(session);
}

void RelayServer::update_interest(const SessionPtr& session) {
    const std::uint32_t mask = session->write_buffer.empty()
                                   ? EventLoop::kEventReadable
                                   : EventLoop::kEventReadable | EventLoop::kEventWritable;
    loop_.update(session->fd, mask);
}

void RelayServer::close_session(const SessionPtr& session) {
    if (session->closing) {
        return;
    }
    session->closing = true;
    leave_channel(session);
    loop_.remove(session->fd);
    ::close(session->fd);
    sessions_.erase(session->fd);
}

void RelayServer::leave_channel(const SessionPtr& session) {
    if (session->channel.empty()) {
        return;
    }
    if (const auto it = channels_.find(session->channel); it != channels_.end()) {
        it->second.erase(session->fd);
        if (it->second.empty()) {
            channels_.erase(it);
        }
    }
    session->channel.clear();
}

void RelayServer::schedule_ping() {
    if (config_.ping_interval <= std::chrono::seconds::zero()) {
        return;
    }
    ping_timer_ = loop_.schedule_after(config_.ping_interval, [this]() {
        ping_timer_.reset();
        std::vector<SessionPtr> joined;
        for (const auto& [fd, session] : sessions_) {
            if (!session->channel.empty()) {
                joined.push_back(session);
            }
        }
        for (const auto& session : joined) {
            queue_text(session, "PING\n");
        }
        schedule_ping();
    });
}

}  // namespace meshstate::relay
