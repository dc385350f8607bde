// AMMSim - Arbitrage Types Implementation

#include <ammsim/arbitrage/types.hpp>
#include <algorithm>
#include <cctype>

namespace ammsim::arbitrage {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

std::optional<SearchMode> parse_search_mode(const std::string& text) {
    if (text == "screen" || text == "fast") return SearchMode::Screen;
    if (text == "exact" || text == "deep") return SearchMode::Exact;
    if (text == "constant_product" || text == "v2") return SearchMode::ConstantProduct;
    return std::nullopt;
}

std::optional<LegOrder> parse_leg_order(const std::string& text) {
    if (text == "buy_first") return LegOrder::BuyFirst;
    if (text == "sell_first") return LegOrder::SellFirst;
    return std::nullopt;
}

bool GasConfig::is_numeraire(const std::string& symbol) const {
    if (symbol.empty()) return false;
    std::string wanted = upper(symbol);
    return std::any_of(numeraire_symbols.begin(), numeraire_symbols.end(),
                       [&](const std::string& s) { return upper(s) == wanted; });
}

std::string pair_key(const TokenInfo& token0, const TokenInfo& token1) {
    return lower(token0.address) + "/" + lower(token1.address);
}

void rank(SearchReport& report, size_t max_results) {
    auto& opps = report.opportunities;
    std::stable_sort(opps.begin(), opps.end(),
                     [](const ArbitrageOpportunity& a, const ArbitrageOpportunity& b) {
                         if (a.executable != b.executable) return a.executable;
                         return a.net_spread_bps > b.net_spread_bps;
                     });
    report.best.reset();
    if (!opps.empty()) {
        report.best = opps.front();
    }
    if (opps.size() > max_results) {
        opps.resize(max_results);
    }
}

}  // namespace ammsim::arbitrage
