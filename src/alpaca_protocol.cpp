#include "roofwatch/alpaca_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace roofwatch {

namespace {
bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}
}  // namespace

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string json_string(const std::string& s) {
    return "\"" + json_escape(s) + "\"";
}

std::optional<std::string> find_param(const ParamMap& params, const std::string& name) {
    for (const auto& kv : params) {
        if (iequals(kv.first, name)) return kv.second;
    }
    return std::nullopt;
}

std::optional<bool> parse_bool(const std::string& value) {
    if (iequals(value, "true")) return true;
    if (iequals(value, "false")) return false;
    return std::nullopt;
}

std::uint32_t parse_transaction_id(const ParamMap& params) {
    auto raw = find_param(params, "ClientTransactionID");
    if (!raw || raw->empty()) return 0;
    if (!std::all_of(raw->begin(), raw->end(), [](unsigned char c) { return std::isdigit(c); })) return 0;
    try {
        unsigned long long v = std::stoull(*raw);
        if (v > 0xFFFFFFFFull) return 0;
        return static_cast<std::uint32_t>(v);
    } catch (const std::exception&) {
        return 0;
    }
}

std::string make_envelope(const std::string* value_json,
                          std::uint32_t client_transaction_id,
                          std::uint32_t server_transaction_id,
                          int error_number,
                          const std::string& error_message) {
    std::ostringstream oss;
    oss << "{";
    if (value_json) oss << "\"Value\":" << *value_json << ",";
    oss << "\"ClientTransactionID\":" << client_transaction_id << ","
        << "\"ServerTransactionID\":" << server_transaction_id << ","
        << "\"ErrorNumber\":" << error_number << ","
        << "\"ErrorMessage\":" << json_string(error_message)
        << "}";
    return oss.str();
}

std::string iso8601_utc(Clock::time_point t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

SafetyVerdict evaluate_safety(const StatusRecord& record,
                              RoofLabel safe_label,
                              bool connected,
                              std::chrono::seconds stale_after,
                              Clock::time_point now,
                              bool sun_blocks_open) {
    SafetyVerdict v;
    if (!connected) return v;
    if (!record.known()) {
        v.error_number = alpaca_error::kUnspecifiedError;
        v.error_message = "Roof status not yet determined";
        return v;
    }
    if (stale_after.count() > 0 && now - record.updated_at > stale_after) {
        const auto age = std::chrono::duration_cast<std::chrono::seconds>(now - record.updated_at);
        v.error_number = alpaca_error::kUnspecifiedError;
        v.error_message = "Roof status is stale (last update " + std::to_string(age.count()) + "s ago)";
        return v;
    }
    RoofLabel effective = record.label;
    if (sun_blocks_open && effective == RoofLabel::OPEN) effective = RoofLabel::CLOSED;
    v.safe = effective == safe_label;
    return v;
}

}  // namespace roofwatch
