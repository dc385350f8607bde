// AMMSim - Logging
// Level-filtered messages to stderr or a caller-installed sink

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ammsim::log {

enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

inline constexpr const char* to_string(Level l) noexcept {
    switch (l) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "unknown";
}

std::optional<Level> parse_level(std::string_view text);

void set_level(Level level);
Level level();
[[nodiscard]] bool enabled(Level level);

using Sink = std::function<void(Level, const std::string&)>;

// Replace the output; an empty sink restores stderr
void set_sink(Sink sink);

void write(Level level, const std::string& message);

inline void trace(const std::string& message) { write(Level::Trace, message); }
inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warn(const std::string& message) { write(Level::Warn, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

}  // namespace ammsim::log
