#include "meshstate/Config.hpp"
#include "meshstate/core/ConfigLoader.hpp"
#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/relay/EventLoop.hpp"
#include "meshstate/relay/RelayServer.hpp"

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace {

using meshstate::relay::EventLoop;
using meshstate::relay::RelayServer;
using meshstate::relay::RelayServerConfig;

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

using Endpoint = std::pair<std::string, std::uint16_t>;

struct CliConfig {
    std::optional<Endpoint> listen;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    std::optional<std::size_t> max_members;
    bool quiet{false};
    bool show_help{false};
    std::string error;
};

std::optional<unsigned long> parse_decimal(const std::string& text, unsigned long max) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const auto value = std::strtoul(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || text.front() == '-' || value > max) {
        return std::nullopt;
    }
    return value;
}

// host:port, split at the last colon.
std::optional<Endpoint> parse_endpoint(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    const auto port = parse_decimal(text.substr(colon + 1), 65535);
    if (!port || *port == 0) {
        return std::nullopt;
    }
    return Endpoint{text.substr(0, colon), static_cast<std::uint16_t>(*port)};
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    for (int i = 1; i < argc && parsed.error.empty(); ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
        } else if (arg == "--quiet") {
            parsed.quiet = true;
        } else if (arg == "--listen" || arg == "--config" || arg == "--log-level" || arg == "--max-members") {
            if (i + 1 >= argc) {
                parsed.error = arg + " requires a value";
                break;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                parsed.config_path = value;
            } else if (arg == "--listen") {
                parsed.listen = parse_endpoint(value);
                if (!parsed.listen) {
                    parsed.error = "Invalid --listen value: " + value;
                }
            } else if (arg == "--log-level") {
                if (!meshstate::daemon::StructuredLogger::parse_level(value)) {
                    parsed.error = "Invalid --log-level value: " + value;
                }
                parsed.log_level = value;
            } else if (const auto members = parse_decimal(value, 4096)) {
                parsed.max_members = static_cast<std::size_t>(*members);
            } else {
                parsed.error = "Invalid --max-members value: " + value;
            }
        } else {
            parsed.error = "Unknown argument: " + arg;
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --listen host:port   Address to bind (default 0.0.0.0:9750)\n"
              << "  --config file        JSON configuration; uses the 'relay' and 'logging' sections\n"
              << "  --max-members n      Members allowed per channel, 0 for no limit\n"
              << "  --log-level level    debug, info, warning or error\n"
              << "  --quiet              Disable structured logging\n"
              << "  -h, --help           Show this message\n";
}

// File settings first, then command-line overrides.
RelayServerConfig server_config(const CliConfig& cli, const meshstate::Config& settings) {
    RelayServerConfig config{};
    if (cli.config_path) {
        config.listen_port = settings.relay_port;
    }
    config.ping_interval = settings.relay_ping_interval;
    config.max_line_bytes = settings.relay_max_line_bytes;
    config.max_channel_members = cli.max_members.value_or(settings.relay_max_channel_members);
    if (cli.listen) {
        std::tie(config.listen_host, config.listen_port) = *cli.listen;
    }
    return config;
}

void configure_logging(const CliConfig& cli, const meshstate::Config& settings) {
    using meshstate::daemon::StructuredLogger;
    auto& logger = StructuredLogger::instance();
    logger.set_enabled(settings.logging_enabled && !cli.quiet);
    if (auto level = StructuredLogger::parse_level(cli.log_level.value_or(settings.logging_level))) {
        logger.set_min_level(*level);
    }
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.error.empty()) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    meshstate::Config settings{};
    if (cli.config_path) {
        try {
            meshstate::config::load_config_file(*cli.config_path, settings);
        } catch (const meshstate::config::ConfigError& error) {
            std::cerr << error.what() << "\n";
            if (!error.hint.empty()) {
                std::cerr << "Hint: " << error.hint << "\n";
            }
            return EXIT_FAILURE;
        }
    }
    configure_logging(cli, settings);
    const auto config = server_config(cli, settings);

    install_signal_handlers();

    EventLoop loop;
    RelayServer server(loop, config);
    if (!server.start()) {
        std::cerr << "Failed to start relay on " << config.listen_host << ":" << config.listen_port << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "Relay server listening on " << config.listen_host << ":" << server.port() << std::endl;

    g_loop = &loop;
    loop.run();
    g_loop = nullptr;

    server.stop();
    return EXIT_SUCCESS;
}
