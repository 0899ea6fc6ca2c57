#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "field_validators.hpp"
#include "model_errors.hpp"

using namespace roadvlm;

// ─────────────────────────────────────────────────────────────────────────────
// Enumerated fields
// ─────────────────────────────────────────────────────────────────────────────

TEST(FieldValidatorsTest, ActionTokensRoundTrip) {
    for (ActionType v : enum_values<ActionType>()) {
        EXPECT_EQ(parse_action(to_string(v)), v);
    }
}

TEST(FieldValidatorsTest, WeatherTokensRoundTrip) {
    for (WeatherCondition v : enum_values<WeatherCondition>()) {
        EXPECT_EQ(parse_weather(to_string(v)), v);
    }
}

TEST(FieldValidatorsTest, TimeOfDayTokensRoundTrip) {
    for (TimeOfDay v : enum_values<TimeOfDay>()) {
        EXPECT_EQ(parse_time_of_day(to_string(v)), v);
    }
}

TEST(FieldValidatorsTest, ActionIsCaseSensitive) {
    EXPECT_EQ(parse_action("TURN_LEFT"), ActionType::TurnLeft);
    EXPECT_THROW(parse_action("turn_left"), InvalidEnumValue);
    EXPECT_THROW(parse_action("Stop"), InvalidEnumValue);
}

TEST(FieldValidatorsTest, WeatherAndTimeIgnoreCase) {
    EXPECT_EQ(parse_weather("Rainy"), WeatherCondition::Rainy);
    EXPECT_EQ(parse_weather("FOGGY"), WeatherCondition::Foggy);
    EXPECT_EQ(parse_time_of_day("Night"), TimeOfDay::Night);
    EXPECT_EQ(parse_time_of_day("DUSK"), TimeOfDay::Dusk);
}

TEST(FieldValidatorsTest, UnknownEnumValueCarriesContext) {
    try {
        parse_weather("sunny");
        FAIL() << "expected InvalidEnumValue";
    } catch (const InvalidEnumValue& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidEnumValue);
        EXPECT_EQ(e.field(), "weather");
        EXPECT_EQ(e.raw_value(), "sunny");
        EXPECT_EQ(e.allowed_values(), "clear, rainy, snowy, foggy, cloudy");
        EXPECT_TRUE(e.raw_content().empty());
    }
}

TEST(FieldValidatorsTest, TimeOfDayOutsideSetFails) {
    EXPECT_THROW(parse_time_of_day("noon"), InvalidEnumValue);
}

TEST(FieldValidatorsTest, ObjectTypeAndLightState) {
    EXPECT_EQ(parse_object_type("traffic_light"), ObjectType::TrafficLight);
    EXPECT_THROW(parse_object_type("truck"), InvalidEnumValue);
    EXPECT_EQ(parse_traffic_light_state("Green"), TrafficLightState::Green);
    EXPECT_THROW(parse_traffic_light_state("blue"), InvalidEnumValue);
}

// ─────────────────────────────────────────────────────────────────────────────
// Confidence
// ─────────────────────────────────────────────────────────────────────────────

TEST(ConfidenceTest, AcceptedForms) {
    EXPECT_DOUBLE_EQ(parse_confidence("0"), 0.0);
    EXPECT_DOUBLE_EQ(parse_confidence("0.0"), 0.0);
    EXPECT_DOUBLE_EQ(parse_confidence("0.85"), 0.85);
    EXPECT_DOUBLE_EQ(parse_confidence(".5"), 0.5);
    EXPECT_DOUBLE_EQ(parse_confidence("0.999"), 0.999);
    EXPECT_DOUBLE_EQ(parse_confidence("1"), 1.0);
    EXPECT_DOUBLE_EQ(parse_confidence("1.0"), 1.0);
}

TEST(ConfidenceTest, RejectedForms) {
    EXPECT_THROW(parse_confidence("1.5"), InvalidConfidence);
    EXPECT_THROW(parse_confidence("-0.1"), InvalidConfidence);
    EXPECT_THROW(parse_confidence("abc"), InvalidConfidence);
    EXPECT_THROW(parse_confidence(""), InvalidConfidence);
    EXPECT_THROW(parse_confidence("1.01"), InvalidConfidence);
}

TEST(ConfidenceTest, RejectedValueIsKept) {
    try {
        parse_confidence("1.5");
        FAIL() << "expected InvalidConfidence";
    } catch (const InvalidConfidence& e) {
        EXPECT_EQ(e.raw_value(), "1.5");
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfidence);
    }
}

TEST(ConfidenceTest, NumericRange) {
    EXPECT_DOUBLE_EQ(check_confidence(0.0), 0.0);
    EXPECT_DOUBLE_EQ(check_confidence(1.0), 1.0);
    EXPECT_THROW(check_confidence(1.0001), InvalidConfidence);
    EXPECT_THROW(check_confidence(-0.5), InvalidConfidence);
}

TEST(ConfidenceTest, NumericRejectionKeepsWrittenValue) {
    try {
        check_confidence(1.0000001);
        FAIL() << "expected InvalidConfidence";
    } catch (const InvalidConfidence& e) {
        EXPECT_EQ(e.raw_value(), "1.0000001");
    }
    try {
        check_confidence(-1e-7, "-0.0000001");
        FAIL() << "expected InvalidConfidence";
    } catch (const InvalidConfidence& e) {
        EXPECT_EQ(e.raw_value(), "-0.0000001");
    }
}

TEST(ConfidenceTest, VeryLongStringRejected) {
    EXPECT_THROW(parse_confidence("0." + std::string(200000, '5')), InvalidConfidence);
}

// ─────────────────────────────────────────────────────────────────────────────
// Angle
// ─────────────────────────────────────────────────────────────────────────────

TEST(AngleTest, WrapsIntoFullCircle) {
    EXPECT_DOUBLE_EQ(normalize_angle(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_angle(45.5), 45.5);
    EXPECT_DOUBLE_EQ(normalize_angle(360.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_angle(400.0), 40.0);
    EXPECT_DOUBLE_EQ(normalize_angle(-90.0), 270.0);
}

TEST(AngleTest, NonFiniteRejected) {
    EXPECT_THROW(normalize_angle(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(normalize_angle(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

TEST(StringHelpersTest, TrimAndLower) {
    EXPECT_EQ(trim("  highway \n"), "highway");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(to_lower("CloUDy"), "cloudy");
}
