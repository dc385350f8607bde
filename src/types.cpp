// AMMSim - Core Types Implementation

#include <ammsim/types.hpp>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace ammsim {

namespace {

bool is_decimal_digits(const std::string& s, size_t start) {
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

HighPrecision pow10(int exponent) {
    return mp::pow(HighPrecision(10), exponent);
}

}  // namespace

std::string to_string(const U256& v) {
    return v.str();
}

std::string to_string(const I256& v) {
    return v.str();
}

U256 parse_u256(const std::string& text) {
    if (!is_decimal_digits(text, 0)) {
        throw Exception(errors::INVALID_ARGUMENT, "not an unsigned integer: '" + text + "'");
    }
    if (text.size() > 78) {
        throw MathOverflow("value exceeds 256 bits: " + text);
    }
    // 78 digits can still exceed 2^256 - 1
    U512 wide(text);
    if (wide > U512(MAX_U256)) {
        throw MathOverflow("value exceeds 256 bits: " + text);
    }
    return U256(text);
}

I256 parse_i256(const std::string& text) {
    bool negative = !text.empty() && text[0] == '-';
    size_t start = negative ? 1 : 0;
    if (!is_decimal_digits(text, start)) {
        throw Exception(errors::INVALID_ARGUMENT, "not an integer: '" + text + "'");
    }
    U256 magnitude = parse_u256(text.substr(start));
    I256 value(magnitude);
    return negative ? I256(-value) : value;
}

double to_double(const U256& v) {
    return v.convert_to<double>();
}

double to_double(const I256& v) {
    return v.convert_to<double>();
}

double to_human(const U256& raw, int decimals) {
    HighPrecision scaled = HighPrecision(raw.str()) / pow10(decimals);
    return scaled.convert_to<double>();
}

U256 from_human(double amount, int decimals) {
    if (!std::isfinite(amount) || amount <= 0.0) {
        return U256(0);
    }
    // Scale the shortest decimal form, so 10000.3 is exactly 10000.3
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), amount);
    if (ec != std::errc{}) {
        throw Exception(errors::INVALID_ARGUMENT, "unrepresentable amount");
    }
    HighPrecision scaled = mp::round(HighPrecision(std::string(buffer, end)) * pow10(decimals));
    if (scaled > HighPrecision(MAX_U256.str())) {
        throw MathOverflow("amount does not fit in 256 bits");
    }
    return static_cast<U256>(scaled);
}

}  // namespace ammsim
