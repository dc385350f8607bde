// AMMSim - Core Types
// Checked wide integers, fixed-point constants, errors and Result

#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace ammsim {

namespace mp = boost::multiprecision;

// Fixed-width checked integers. Overflow and unsigned underflow raise
// std::overflow_error / std::range_error instead of wrapping.
using U256 = mp::number<mp::cpp_int_backend<256, 256, mp::unsigned_magnitude, mp::checked, void>>;
using U512 = mp::number<mp::cpp_int_backend<512, 512, mp::unsigned_magnitude, mp::checked, void>>;
using I256 = mp::number<mp::cpp_int_backend<256, 256, mp::signed_magnitude, mp::checked, void>>;

// 80 significant decimal digits, used for human-readable prices
using HighPrecision = mp::number<mp::cpp_dec_float<80>>;

inline const U256 Q96 = U256(1) << 96;
inline const U256 Q128 = U256(1) << 128;
inline const U256 MAX_U256 = std::numeric_limits<U256>::max();
inline const U256 MAX_U128 = (U256(1) << 128) - 1;
inline const I256 MAX_I128 = (I256(1) << 127) - 1;
inline const I256 MIN_I128 = -(I256(1) << 127);

// Fee units: parts per million of the input amount
constexpr uint32_t FEE_DENOMINATOR = 1'000'000;

namespace fees {
constexpr uint32_t FEE_001 = 100;     // 0.01%
constexpr uint32_t FEE_005 = 500;     // 0.05%
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
}

// Lossless decimal text for wide integers
std::string to_string(const U256& v);
std::string to_string(const I256& v);
U256 parse_u256(const std::string& text);
I256 parse_i256(const std::string& text);

// U256 -> double, loses precision beyond 53 bits
double to_double(const U256& v);
double to_double(const I256& v);

// Scale a raw token amount to human units (raw / 10^decimals)
double to_human(const U256& raw, int decimals);
// Scale human units to raw token units, rounding to the nearest unit
U256 from_human(double amount, int decimals);

// Error codes
namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t TICK_OUT_OF_RANGE = -1;
constexpr int32_t SQRT_PRICE_OUT_OF_RANGE = -2;
constexpr int32_t DIVISION_BY_ZERO = -3;
constexpr int32_t MATH_OVERFLOW = -4;
constexpr int32_t INVALID_POOL_STATE = -5;
constexpr int32_t TOKEN_MISMATCH = -6;
constexpr int32_t INCOMPLETE_SIMULATION = -7;
constexpr int32_t INVALID_ARGUMENT = -8;
constexpr int32_t DATA_UNAVAILABLE = -9;
}

inline constexpr const char* error_name(int32_t code) noexcept {
    switch (code) {
        case errors::OK: return "ok";
        case errors::TICK_OUT_OF_RANGE: return "tick_out_of_range";
        case errors::SQRT_PRICE_OUT_OF_RANGE: return "sqrt_price_out_of_range";
        case errors::DIVISION_BY_ZERO: return "division_by_zero";
        case errors::MATH_OVERFLOW: return "math_overflow";
        case errors::INVALID_POOL_STATE: return "invalid_pool_state";
        case errors::TOKEN_MISMATCH: return "token_mismatch";
        case errors::INCOMPLETE_SIMULATION: return "incomplete_simulation";
        case errors::INVALID_ARGUMENT: return "invalid_argument";
        case errors::DATA_UNAVAILABLE: return "data_unavailable";
    }
    return "unknown";
}

// Base exception; carries one of the errors:: codes
class Exception : public std::runtime_error {
public:
    Exception(int32_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

class TickOutOfRange : public Exception {
public:
    explicit TickOutOfRange(int32_t tick)
        : Exception(errors::TICK_OUT_OF_RANGE, "tick out of range: " + std::to_string(tick)) {}
};

class SqrtPriceOutOfRange : public Exception {
public:
    explicit SqrtPriceOutOfRange(const U256& sqrt_price)
        : Exception(errors::SQRT_PRICE_OUT_OF_RANGE, "sqrt price out of range: " + to_string(sqrt_price)) {}
};

class DivisionByZero : public Exception {
public:
    DivisionByZero() : Exception(errors::DIVISION_BY_ZERO, "division by zero") {}
};

class MathOverflow : public Exception {
public:
    explicit MathOverflow(const std::string& what)
        : Exception(errors::MATH_OVERFLOW, "overflow: " + what) {}
};

class InvalidPoolState : public Exception {
public:
    explicit InvalidPoolState(const std::string& what)
        : Exception(errors::INVALID_POOL_STATE, "invalid pool state: " + what) {}
};

class TokenMismatch : public Exception {
public:
    explicit TokenMismatch(const std::string& what)
        : Exception(errors::TOKEN_MISMATCH, "token mismatch: " + what) {}
};

/// Error information
struct Error {
    int32_t code = errors::OK;
    std::string message;

    explicit operator bool() const noexcept { return code != errors::OK; }
};

/// Value or error, for per-pair operations that must not abort a batch
template<typename T>
struct Result {
    T value;
    Error error;

    [[nodiscard]] bool ok() const noexcept { return !error; }
    explicit operator bool() const noexcept { return ok(); }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(int32_t code, std::string message) {
        Result r;
        r.error = Error{code, std::move(message)};
        return r;
    }
};

/// Run fn (returning a Result) and turn thrown math and pool errors into a
/// failed Result. Checked-integer overflow surfaces as MATH_OVERFLOW.
template<typename Fn>
auto capture_errors(Fn&& fn) -> decltype(fn()) {
    using R = decltype(fn());
    try {
        return fn();
    } catch (const Exception& e) {
        return R::failure(e.code(), e.what());
    } catch (const std::overflow_error& e) {
        return R::failure(errors::MATH_OVERFLOW, e.what());
    } catch (const std::range_error& e) {
        return R::failure(errors::MATH_OVERFLOW, e.what());
    }
}

}  // namespace ammsim
