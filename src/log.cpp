// AMMSim - Logging Implementation

#include <ammsim/log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace ammsim::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_sink_mutex;
Sink g_sink;

}  // namespace

std::optional<Level> parse_level(std::string_view text) {
    if (text == "trace") return Level::Trace;
    if (text == "debug") return Level::Debug;
    if (text == "info") return Level::Info;
    if (text == "warn" || text == "warning") return Level::Warn;
    if (text == "error") return Level::Error;
    if (text == "off" || text == "none") return Level::Off;
    return std::nullopt;
}

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

bool enabled(Level level) {
    return level != Level::Off && level >= g_level.load();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        sink = g_sink;
    }
    // Called unlocked; a sink may log
    if (sink) {
        sink(level, message);
        return;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::cerr << "[ammsim] " << to_string(level) << ": " << message << std::endl;
}

}  // namespace ammsim::log
