#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "frame_types.hpp"

namespace roofwatch {

// ASCOM Alpaca error numbers.
namespace alpaca_error {
constexpr int kNone = 0;
constexpr int kNotImplemented = 0x400;
constexpr int kInvalidValue = 0x401;
constexpr int kValueNotSet = 0x402;
constexpr int kNotConnected = 0x407;
constexpr int kInvalidOperation = 0x40B;
constexpr int kActionNotImplemented = 0x40C;
constexpr int kUnspecifiedError = 0x4FF;
}  // namespace alpaca_error

using ParamMap = std::multimap<std::string, std::string>;

std::string json_escape(const std::string& s);
std::string json_string(const std::string& s);
inline std::string json_bool(bool b) { return b ? "true" : "false"; }

// Alpaca parameter names are case-insensitive, values are not.
std::optional<std::string> find_param(const ParamMap& params, const std::string& name);

// Strict "true"/"false", any letter case.
std::optional<bool> parse_bool(const std::string& value);

// Missing or unparsable transaction ids are reported back as 0.
std::uint32_t parse_transaction_id(const ParamMap& params);

// Standard response body. `value_json` is omitted when null (PUT methods).
std::string make_envelope(const std::string* value_json,
                          std::uint32_t client_transaction_id,
                          std::uint32_t server_transaction_id,
                          int error_number = alpaca_error::kNone,
                          const std::string& error_message = "");

std::string iso8601_utc(Clock::time_point t);

struct SafetyVerdict {
    bool safe{false};
    int error_number{alpaca_error::kNone};
    std::string error_message;
};

// IsSafe from one snapshot. A disconnected device is plainly unsafe. UNKNOWN
// and stale records are unsafe with an error. stale_after of zero disables
// staleness. `sun_blocks_open` reads an OPEN record as CLOSED.
SafetyVerdict evaluate_safety(const StatusRecord& record,
                              RoofLabel safe_label,
                              bool connected,
                              std::chrono::seconds stale_after,
                              Clock::time_point now,
                              bool sun_blocks_open = false);

}  // namespace roofwatch
