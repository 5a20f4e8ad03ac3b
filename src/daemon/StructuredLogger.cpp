#include "meshstate/daemon/StructuredLogger.hpp"

#include "meshstate/protocol/Json.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace meshstate::daemon {

namespace {

constexpr std::array<std::string_view, 4> kLevelNames{"debug", "info", "warning", "error"};

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto whole = std::chrono::floor<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - whole).count();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(whole);

    std::tm parts{};
    gmtime_r(&seconds, &parts);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
                  parts.tm_hour, parts.tm_min, parts.tm_sec, static_cast<int>(millis));
    return buffer;
}

void append_quoted(std::string& line, std::string_view text) {
    line.push_back('"');
    line += protocol::escape_json(text);
    line.push_back('"');
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!accepts(level)) {
        return;
    }

    std::string line;
    line.reserve(96 + event.size());
    line += "{\"ts\":";
    append_quoted(line, utc_timestamp());
    line += ",\"seq\":";
    line += std::to_string(++sequence_);
    line += ",\"level\":";
    append_quoted(line, level_name(level));
    line += ",\"event\":";
    append_quoted(line, event);

    if (!fields.empty()) {
        line += ",\"fields\":{";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line.push_back(',');
            }
            first = false;
            append_quoted(line, key);
            line.push_back(':');
            append_quoted(line, value);
        }
        line.push_back('}');
    }
    line += "}\n";

    std::ostream& out = sink_ ? *sink_ : std::clog;
    out << line;
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_min_level(Level level) {
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

StructuredLogger::Level StructuredLogger::min_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return min_level_;
}

void StructuredLogger::set_sink(std::ostream* sink) {
    std::scoped_lock lock(mutex_);
    sink_ = sink;
}

std::string_view StructuredLogger::level_name(Level level) noexcept {
    return kLevelNames[static_cast<std::size_t>(level)];
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == name) {
            return static_cast<Level>(i);
        }
    }
    return std::nullopt;
}

bool StructuredLogger::accepts(Level level) const noexcept {
    return enabled_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

}  // namespace meshstate::daemon
