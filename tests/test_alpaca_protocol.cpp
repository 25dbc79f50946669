#include <gtest/gtest.h>

#include "roofwatch/alpaca_protocol.hpp"

using namespace roofwatch;
using namespace std::chrono_literals;

TEST(AlpacaProtocolTest, EnvelopeWithValue) {
    const std::string value = "true";
    EXPECT_EQ(make_envelope(&value, 12, 34),
              R"({"Value":true,"ClientTransactionID":12,"ServerTransactionID":34,"ErrorNumber":0,"ErrorMessage":""})");
}

TEST(AlpacaProtocolTest, EnvelopeWithoutValue) {
    EXPECT_EQ(make_envelope(nullptr, 0, 1, alpaca_error::kNotImplemented, "no \"such\" thing"),
              R"({"ClientTransactionID":0,"ServerTransactionID":1,"ErrorNumber":1024,"ErrorMessage":"no \"such\" thing"})");
}

TEST(AlpacaProtocolTest, JsonEscaping) {
    EXPECT_EQ(json_string("a\\b\n"), "\"a\\\\b\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\\u0001");
}

TEST(AlpacaProtocolTest, ParameterNamesIgnoreCase) {
    ParamMap params{{"clienttransactionid", "5"}, {"CONNECTED", "True"}};
    EXPECT_EQ(find_param(params, "ClientTransactionID").value_or(""), "5");
    EXPECT_EQ(find_param(params, "Connected").value_or(""), "True");
    EXPECT_FALSE(find_param(params, "Missing").has_value());
}

TEST(AlpacaProtocolTest, TransactionIdParsing) {
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", "42"}}), 42u);
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", "4294967295"}}), 4294967295u);
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", "4294967296"}}), 0u);
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", "-3"}}), 0u);
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", "12abc"}}), 0u);
    EXPECT_EQ(parse_transaction_id({{"ClientTransactionID", ""}}), 0u);
    EXPECT_EQ(parse_transaction_id({}), 0u);
}

TEST(AlpacaProtocolTest, BooleanParsing) {
    EXPECT_EQ(parse_bool("true"), std::optional<bool>(true));
    EXPECT_EQ(parse_bool("FALSE"), std::optional<bool>(false));
    EXPECT_FALSE(parse_bool("1").has_value());
    EXPECT_FALSE(parse_bool("yes").has_value());
    EXPECT_FALSE(parse_bool("").has_value());
}

TEST(AlpacaProtocolTest, Iso8601) {
    EXPECT_EQ(iso8601_utc(Clock::time_point(std::chrono::seconds(1714598102))), "2024-05-01T21:15:02Z");
}

TEST(SafetyVerdictTest, FollowsConfiguredLabel) {
    StatusRecord open;
    open.label = RoofLabel::OPEN;
    open.updated_at = Clock::now();
    StatusRecord closed = open;
    closed.label = RoofLabel::CLOSED;

    EXPECT_TRUE(evaluate_safety(open, RoofLabel::OPEN, true, 0s, Clock::now()).safe);
    EXPECT_FALSE(evaluate_safety(closed, RoofLabel::OPEN, true, 0s, Clock::now()).safe);
    EXPECT_FALSE(evaluate_safety(open, RoofLabel::CLOSED, true, 0s, Clock::now()).safe);
    EXPECT_TRUE(evaluate_safety(closed, RoofLabel::CLOSED, true, 0s, Clock::now()).safe);
    EXPECT_EQ(evaluate_safety(open, RoofLabel::OPEN, true, 0s, Clock::now()).error_number, 0);
}

TEST(SafetyVerdictTest, UnknownIsUnsafe) {
    StatusRecord unknown;
    auto v = evaluate_safety(unknown, RoofLabel::OPEN, true, 0s, Clock::now());
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.error_number, alpaca_error::kUnspecifiedError);
}

TEST(SafetyVerdictTest, DisconnectedIsUnsafeWithoutError) {
    StatusRecord open;
    open.label = RoofLabel::OPEN;
    open.updated_at = Clock::now();
    auto v = evaluate_safety(open, RoofLabel::OPEN, false, 0s, Clock::now());
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.error_number, alpaca_error::kNone);
    EXPECT_TRUE(v.error_message.empty());

    // Unknown stays unsafe without error too while disconnected.
    v = evaluate_safety(StatusRecord{}, RoofLabel::OPEN, false, 0s, Clock::now());
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.error_number, alpaca_error::kNone);
}

TEST(SafetyVerdictTest, SunReadsOpenAsClosed) {
    StatusRecord open;
    open.label = RoofLabel::OPEN;
    open.updated_at = Clock::now();
    StatusRecord closed = open;
    closed.label = RoofLabel::CLOSED;

    auto v = evaluate_safety(open, RoofLabel::OPEN, true, 0s, Clock::now(), true);
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.error_number, alpaca_error::kNone);
    EXPECT_TRUE(evaluate_safety(open, RoofLabel::OPEN, true, 0s, Clock::now(), false).safe);
    // Safe-when-closed setups are not affected by daylight.
    EXPECT_TRUE(evaluate_safety(closed, RoofLabel::CLOSED, true, 0s, Clock::now(), true).safe);
}

TEST(SafetyVerdictTest, StaleStatusIsUnsafe) {
    StatusRecord open;
    open.label = RoofLabel::OPEN;
    const auto now = Clock::now();
    open.updated_at = now - 10min;

    auto v = evaluate_safety(open, RoofLabel::OPEN, true, 300s, now);
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.error_number, alpaca_error::kUnspecifiedError);
    EXPECT_NE(v.error_message.find("stale"), std::string::npos);

    EXPECT_TRUE(evaluate_safety(open, RoofLabel::OPEN, true, 900s, now).safe);
    EXPECT_TRUE(evaluate_safety(open, RoofLabel::OPEN, true, 0s, now).safe);
}
