#pragma once

#include "meshstate/Config.hpp"
#include "meshstate/protocol/Json.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace meshstate::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Overlays the values present in `document` onto `config`.
// Sections: mesh, history, relay, logging.
void apply_config(const protocol::JsonValue& document, Config& config);

void load_config_text(std::string_view text, Config& config);
void load_config_file(const std::filesystem::path& path, Config& config);

}  // namespace meshstate::config
