#pragma once

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meshstate::daemon {

// Process-wide JSON-lines logger. One object per line:
// {"ts":..., "seq":..., "level":..., "event":..., "fields":{...}}
class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    // Records below `level` are dropped. Defaults to Info.
    void set_min_level(Level level);
    [[nodiscard]] Level min_level() const noexcept;

    // nullptr restores std::clog.
    void set_sink(std::ostream* sink);

    static std::string_view level_name(Level level) noexcept;
    static std::optional<Level> parse_level(std::string_view name) noexcept;

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    bool accepts(Level level) const noexcept;

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::uint64_t sequence_{0};
    std::ostream* sink_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace meshstate::daemon
