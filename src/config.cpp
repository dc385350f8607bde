// AMMSim - Configuration Implementation

#include <ammsim/config.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ammsim {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing comment outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

std::string digits(const std::string& key, const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c != '_') out.push_back(c);
    }
    if (out.empty()) {
        throw std::runtime_error("Missing value for " + key);
    }
    return out;
}

uint64_t parse_uint(const std::string& key, const std::string& value) {
    std::string text = digits(key, value);
    size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    if (used != text.size() || text[0] == '-') {
        throw std::runtime_error("Invalid integer for " + key + ": " + value);
    }
    return parsed;
}

double parse_double(const std::string& key, const std::string& value) {
    std::string text = digits(key, value);
    size_t used = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid number for " + key + ": " + value);
    }
    if (used != text.size()) {
        throw std::runtime_error("Invalid number for " + key + ": " + value);
    }
    return parsed;
}

U256 parse_wide(const std::string& key, const std::string& value) {
    try {
        return parse_u256(digits(key, value));
    } catch (const Exception& e) {
        throw std::runtime_error("Invalid integer for " + key + ": " + e.what());
    }
}

I256 parse_signed_wide(const std::string& key, const std::string& value) {
    try {
        return parse_i256(digits(key, value));
    } catch (const Exception& e) {
        throw std::runtime_error("Invalid integer for " + key + ": " + e.what());
    }
}

// ["WETH", "ETH"]
std::vector<std::string> parse_string_list(const std::string& key, const std::string& value) {
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw std::runtime_error("Expected a list for " + key + ": " + value);
    }
    std::vector<std::string> items;
    std::stringstream inner(value.substr(1, value.size() - 2));
    std::string item;
    while (std::getline(inner, item, ',')) {
        item = unquote(trim(item));
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                current_section = trim(line.substr(1, end - 1));
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);
        std::string qualified = current_section + "." + key;

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "mode") {
                auto mode = arbitrage::parse_search_mode(value);
                if (!mode) throw std::runtime_error("Unknown search mode: " + value);
                config.general.mode = *mode;
            }
            else if (key == "max_pair_evaluations") config.general.max_pair_evaluations = parse_uint(qualified, value);
            else if (key == "worker_threads") config.general.worker_threads = static_cast<unsigned>(parse_uint(qualified, value));
        }
        else if (current_section == "gas") {
            if (key == "gas_price_wei") config.gas.gas_price_wei = parse_wide(qualified, value);
            else if (key == "gas_units") config.gas.gas_units = parse_uint(qualified, value);
            else if (key == "numeraire_symbols") config.gas.numeraire_symbols = parse_string_list(qualified, raw);
            else if (key == "trade_size_token0") config.gas.trade_size_token0 = parse_double(qualified, value);
        }
        else if (current_section == "screen") {
            if (key == "max_results") config.screen.max_results = parse_uint(qualified, value);
        }
        else if (current_section == "exact") {
            if (key == "max_tick_crossings") config.exact.max_tick_crossings = static_cast<uint32_t>(parse_uint(qualified, value));
            else if (key == "words_each_side") config.exact.window.words_each_side = static_cast<uint32_t>(parse_uint(qualified, value));
            else if (key == "max_ticks") config.exact.window.max_ticks = static_cast<uint32_t>(parse_uint(qualified, value));
            else if (key == "widen_retries") config.exact.widen_retries = static_cast<uint32_t>(parse_uint(qualified, value));
            else if (key == "leg_order") {
                auto order = arbitrage::parse_leg_order(value);
                if (!order) throw std::runtime_error("Unknown leg order: " + value);
                config.exact.leg_order = *order;
            }
            else if (key == "max_results") config.exact.max_results = parse_uint(qualified, value);
        }
        else if (current_section == "constant_product") {
            if (key == "steps") config.cycle.steps = static_cast<uint32_t>(parse_uint(qualified, value));
            else if (key == "max_fraction_of_reserve") config.cycle.max_fraction_of_reserve = parse_double(qualified, value);
            else if (key == "min_profit_raw") config.cycle.min_profit_raw = parse_signed_wide(qualified, value);
            else if (key == "max_results") config.cycle.max_results = parse_uint(qualified, value);
        }
        else if (current_section == "profile") {
            if (key == "max_segments") config.profile.max_segments = parse_uint(qualified, value);
            else if (key == "gap_percentile") config.profile.gap_percentile = parse_double(qualified, value);
            else if (key == "min_liquidity") config.profile.min_liquidity = parse_signed_wide(qualified, value);
        }
    }

    return config;
}

}  // namespace ammsim
