#include "meshstate/daemon/StructuredLogger.hpp"
#include "meshstate/protocol/Json.hpp"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

namespace {

using meshstate::daemon::StructuredLogger;

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_sink(&sink);

    assert(StructuredLogger::parse_level("warning") == StructuredLogger::Level::Warning);
    assert(!StructuredLogger::parse_level("verbose"));
    assert(StructuredLogger::level_name(StructuredLogger::Level::Debug) == "debug");
    assert(logger.min_level() == StructuredLogger::Level::Info);

    logger.log(StructuredLogger::Level::Debug, "test.hidden");
    logger.log(StructuredLogger::Level::Info, "test.first", {{"peer", "a\"b"}});
    logger.log(StructuredLogger::Level::Error, "test.second");

    auto lines = lines_of(sink.str());
    assert(lines.size() == 2);
    {
        const auto record = meshstate::protocol::parse_json(lines[0]);
        assert(record.find("event")->string_value == "test.first");
        assert(record.find("level")->string_value == "info");
        assert(record.find("fields")->find("peer")->string_value == "a\"b");
        const auto ts = record.find("ts")->string_value;
        assert(ts.size() == 24 && ts.back() == 'Z' && ts[10] == 'T');

        const auto next = meshstate::protocol::parse_json(lines[1]);
        assert(next.find("fields") == nullptr);
        assert(next.find("seq")->number_value == record.find("seq")->number_value + 1);
    }

    sink.str({});
    logger.set_min_level(StructuredLogger::Level::Debug);
    logger.log(StructuredLogger::Level::Debug, "test.visible");
    assert(sink.str().find("test.visible") != std::string::npos);

    sink.str({});
    logger.set_enabled(false);
    logger.log(StructuredLogger::Level::Error, "test.disabled");
    assert(sink.str().empty());

    logger.set_enabled(true);
    logger.set_min_level(StructuredLogger::Level::Info);
    logger.set_sink(nullptr);
    return 0;
}
