// AMMSim - Pool Scan Example
// Loads a TOML config and a JSON market snapshot, runs one search, prints the report
//
// Usage: ammsim_scan <config.toml> <market.json> [screen|exact|constant_product]
//
// market.json: {"states": [PoolState...], "reserves": [ReservePool...], "quotes": [PoolQuote...]}

#include <ammsim/arbitrage/engine.hpp>
#include <ammsim/config.hpp>
#include <ammsim/json.hpp>
#include <ammsim/log.hpp>
#include <fstream>
#include <iostream>

using namespace ammsim;
using namespace ammsim::arbitrage;

namespace {

MarketSnapshot load_market(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open market file: " + path);
    }

    return market_from_json(nlohmann::json::parse(file));
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.toml> <market.json> [mode]" << std::endl;
        return 1;
    }

    try {
        Config config = Config::from_file(argv[1]);
        if (argc > 3) {
            auto mode = parse_search_mode(argv[3]);
            if (!mode) {
                std::cerr << "unknown mode: " << argv[3] << std::endl;
                return 1;
            }
            config.set_mode(*mode);
        }

        MarketSnapshot market = load_market(argv[2]);
        ArbitrageEngine engine{config};
        SearchReport report = engine.run(market);

        nlohmann::json out = report;
        if (!market.states.empty()) {
            out["fee_tiers"] = engine.fee_tiers(market.states);
        }
        std::cout << out.dump(2) << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "invalid market file: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
