#include "meshstate/Config.hpp"
#include "meshstate/Types.hpp"
#include "meshstate/consensus/DivergingGraph.hpp"
#include "meshstate/consensus/NextState.hpp"
#include "meshstate/core/ConfigLoader.hpp"
#include "meshstate/core/StateSync.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/mesh/LoopbackTransport.hpp"
#include "meshstate/mesh/PeerGroup.hpp"
#include "meshstate/relay/EventLoop.hpp"
#include "meshstate/relay/RelayServer.hpp"
#include "meshstate/relay/SignalingClient.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef MESHSTATE_VERSION
#define MESHSTATE_VERSION "v0.1.0"
#endif

namespace {

using namespace std::chrono_literals;

using meshstate::core::StateSync;
using meshstate::daemon::StructuredLogger;
using meshstate::relay::EventLoop;

constexpr std::string_view kVersion = MESHSTATE_VERSION;
constexpr std::size_t kMaxPeers = 32;
constexpr auto kMeshPollInterval = 50ms;
constexpr auto kRoundInterval = 400ms;
constexpr auto kSettleDelay = 1s;
constexpr auto kDeadline = 30s;

EventLoop* g_loop = nullptr;

void handle_signal(int) {
    if (g_loop) {
        g_loop->stop();
    }
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const std::exception& ex, const std::string& hint) {
    std::cerr << ex.what() << std::endl;
    if (!hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

struct CliConfig {
    std::size_t peers{3};
    std::size_t rounds{4};
    std::optional<std::string> config_path;
    bool quiet{false};
    bool show_help{false};
    bool show_version{false};
};

CliConfig parse_arguments(const std::vector<std::string>& args) {
    CliConfig parsed;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        auto require_value = [&](const std::string& option) -> const std::string& {
            if (i + 1 >= args.size()) {
                throw_cli_error("E_MISSING_VALUE", option + " requires a value", "Run with --help for usage");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
        } else if (arg == "--version") {
            parsed.show_version = true;
        } else if (arg == "--quiet") {
            parsed.quiet = true;
        } else if (arg == "--config") {
            parsed.config_path = require_value(arg);
        } else if (arg == "--peers") {
            std::uint64_t value{};
            if (!parse_uint64(require_value(arg), value) || value < 2 || value > kMaxPeers) {
                throw_cli_error("E_INVALID_PEERS",
                                "--peers must be an integer between 2 and " + std::to_string(kMaxPeers));
            }
            parsed.peers = static_cast<std::size_t>(value);
        } else if (arg == "--rounds") {
            std::uint64_t value{};
            if (!parse_uint64(require_value(arg), value) || value == 0 || value > 1000) {
                throw_cli_error("E_INVALID_ROUNDS", "--rounds must be an integer between 1 and 1000");
            }
            parsed.rounds = static_cast<std::size_t>(value);
        } else {
            throw_cli_error("E_UNKNOWN_ARGUMENT", "Unknown argument: " + arg, "Run with --help for usage");
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--peers N] [--rounds N] [--config file] [--quiet]\n";
    std::cout << "Runs a local relay and N peers that join one channel, build a full mesh and\n";
    std::cout << "converge on a shared state while proposing changes, some of them concurrently.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --peers N        Number of peers (2-" << kMaxPeers << ", default 3)\n";
    std::cout << "  --rounds N       Proposal rounds (default 4)\n";
    std::cout << "  --config file    JSON configuration (mesh, history, relay, logging)\n";
    std::cout << "  --quiet          Disable structured logging\n";
    std::cout << "  --version        Print the version and exit\n";
    std::cout << "  -h, --help       Show this message\n";
}

struct SimPeer {
    std::unique_ptr<meshstate::relay::SignalingClient> client;
    std::unique_ptr<meshstate::mesh::PeerGroup> group;
    std::unique_ptr<StateSync> sync;
    std::size_t welcomes{0};
    std::size_t errors{0};
};

std::size_t open_links(const SimPeer& peer) {
    std::size_t open = 0;
    for (const auto& connection : peer.group->peers()) {
        if (connection->ready_state() == meshstate::mesh::ChannelState::Open) {
            ++open;
        }
    }
    return open;
}

class Simulation {
public:
    Simulation(EventLoop& loop, const meshstate::Config& settings, const CliConfig& cli)
        : loop_(loop), settings_(settings), cli_(cli), network_(loop), transports_(network_) {}

    bool start() {
        meshstate::relay::RelayServerConfig relay_config{};
        relay_config.listen_host = "127.0.0.1";
        relay_config.listen_port = 0;
        relay_config.ping_interval = settings_.relay_ping_interval;
        relay_config.max_line_bytes = settings_.relay_max_line_bytes;
        relay_ = std::make_unique<meshstate::relay::RelayServer>(loop_, relay_config);
        if (!relay_->start()) {
            std::cerr << "Failed to start the local relay" << std::endl;
            return false;
        }

        for (std::size_t index = 0; index < cli_.peers; ++index) {
            auto peer_config = settings_;
            if (index > 0) {
                peer_config.local_id.reset();
            }
            auto peer = std::make_unique<SimPeer>();
            peer->group = std::make_unique<meshstate::mesh::PeerGroup>(loop_, transports_, peer_config);
            peer->sync = std::make_unique<StateSync>(*peer->group, peer_config, meshstate::consensus::NextState("genesis", 0));

            auto* raw = peer.get();
            peer->sync->set_peer_join_handler([raw](meshstate::mesh::PeerConnection& connection) {
                try {
                    connection.send("welcome from " + raw->group->local_id());
                } catch (const meshstate::mesh::TransportError&) {
                    // Channel went away between open and the greeting.
                }
            });
            peer->sync->set_unhandled_handler([raw](meshstate::mesh::PeerConnection&, const std::string& payload) {
                if (payload.rfind("welcome from ", 0) == 0) {
                    ++raw->welcomes;
                }
            });
            peer->sync->set_error_handler([raw](const meshstate::core::SyncError& error) {
                ++raw->errors;
                std::cerr << raw->group->local_id() << ": " << error.detail << std::endl;
            });

            meshstate::relay::SignalingClientConfig client_config{};
            client_config.host = "127.0.0.1";
            client_config.port = relay_->port();
            client_config.channel = settings_.relay_channel;
            client_config.max_line_bytes = settings_.relay_max_line_bytes;
            peer->client = std::make_unique<meshstate::relay::SignalingClient>(loop_, client_config);
            peer->group->join(*peer->client);
            if (!peer->client->connect()) {
                std::cerr << "Failed to connect peer " << index << " to the relay" << std::endl;
                return false;
            }
            peers_.push_back(std::move(peer));
        }

        std::cout << "Relay on 127.0.0.1:" << relay_->port() << ", " << peers_.size() << " peers joining '"
                  << settings_.relay_channel << "'" << std::endl;

        deadline_timer_ = loop_.schedule_after(std::chrono::duration_cast<std::chrono::milliseconds>(kDeadline), [this]() {
            deadline_timer_.reset();
            std::cerr << "Simulation did not finish in time" << std::endl;
            timed_out_ = true;
            loop_.stop();
        });
        loop_.schedule_after(kMeshPollInterval, [this]() { wait_for_mesh(); });
        return true;
    }

    bool converged() const {
        if (timed_out_ || peers_.empty()) {
            return false;
        }
        const auto& reference = peers_.front()->sync->current();
        for (const auto& peer : peers_) {
            const auto& state = peer->sync->current();
            if (state.state() != reference.state() || state.time() != reference.time()) {
                return false;
            }
        }
        return true;
    }

    void report() const {
        for (const auto& peer : peers_) {
            const auto& state = peer->sync->current();
            const auto& history = peer->sync->history();
            std::cout << peer->group->local_id() << "  state=" << state.state() << " time=" << state.time()
                      << " links=" << open_links(*peer) << " welcomes=" << peer->welcomes
                      << " history=" << history.size() << " furthest="
                      << history.furthest_node().value_or("(root)") << std::endl;
        }
        std::cout << (converged() ? "Converged" : "Diverged") << " after " << proposals_ << " proposals" << std::endl;
    }

    void shutdown() {
        if (deadline_timer_) {
            loop_.cancel(*deadline_timer_);
            deadline_timer_.reset();
        }
        for (auto& peer : peers_) {
            peer->sync.reset();
            peer->group->leave();
            peer->client->close();
        }
        peers_.clear();
        if (relay_) {
            relay_->stop();
        }
    }

private:
    void wait_for_mesh() {
        for (const auto& peer : peers_) {
            if (open_links(*peer) + 1 < peers_.size()) {
                loop_.schedule_after(kMeshPollInterval, [this]() { wait_for_mesh(); });
                return;
            }
        }
        std::cout << "Mesh complete" << std::endl;
        run_round(0);
    }

    void propose(std::size_t index, const std::string& next) {
        auto& peer = *peers_[index % peers_.size()];
        try {
            const auto proposal = peer.sync->propose(next);
            ++proposals_;
            std::cout << "  " << peer.group->local_id() << " proposes " << proposal.next << " at time "
                      << proposal.time << std::endl;
        } catch (const meshstate::consensus::ProtocolViolation& ex) {
            std::cerr << "  proposal " << next << " rejected: " << ex.what() << std::endl;
        }
    }

    void run_round(std::size_t round) {
        if (round >= cli_.rounds) {
            loop_.schedule_after(std::chrono::duration_cast<std::chrono::milliseconds>(kSettleDelay), [this]() {
                loop_.stop();
            });
            return;
        }
        std::cout << "Round " << (round + 1) << std::endl;
        const auto tag = "round-" + std::to_string(round + 1);
        propose(round, tag + "-a");
        // Odd rounds race a second proposal from another peer against the first.
        if (round % 2 == 1) {
            propose(round + 1, tag + "-b");
        }
        loop_.schedule_after(kRoundInterval, [this, round]() { run_round(round + 1); });
    }

    EventLoop& loop_;
    meshstate::Config settings_;
    CliConfig cli_;
    meshstate::mesh::LoopbackNetwork network_;
    meshstate::mesh::LoopbackTransportFactory transports_;
    std::unique_ptr<meshstate::relay::RelayServer> relay_;
    std::vector<std::unique_ptr<SimPeer>> peers_;
    std::optional<meshstate::core::Scheduler::TimerId> deadline_timer_;
    std::size_t proposals_{0};
    bool timed_out_{false};
};

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        const auto cli = parse_arguments(args);
        if (cli.show_help) {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (cli.show_version) {
            std::cout << "meshstate-sim " << kVersion << std::endl;
            return EXIT_SUCCESS;
        }

        meshstate::Config settings{};
        if (cli.config_path) {
            meshstate::config::load_config_file(*cli.config_path, settings);
        }
        auto& logger = StructuredLogger::instance();
        logger.set_enabled(settings.logging_enabled && !cli.quiet);
        if (auto level = StructuredLogger::parse_level(settings.logging_level)) {
            logger.set_min_level(*level);
        }

        install_signal_handlers();

        EventLoop loop;
        g_loop = &loop;
        Simulation simulation(loop, settings, cli);
        if (!simulation.start()) {
            simulation.shutdown();
            g_loop = nullptr;
            return EXIT_FAILURE;
        }

        loop.run();

        simulation.report();
        const bool ok = simulation.converged();
        simulation.shutdown();
        g_loop = nullptr;
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const CliException& ex) {
        print_cli_error(ex, ex.hint());
        return EXIT_FAILURE;
    } catch (const meshstate::config::ConfigError& ex) {
        print_cli_error(ex, ex.hint);
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
