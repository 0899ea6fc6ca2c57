#include <gtest/gtest.h>

#include "model_errors.hpp"
#include "response_parser.hpp"

using namespace roadvlm;

static MultiCallResponse make_responses() {
    MultiCallResponse r;
    r.action    = "Based on the red light ahead.\nAction: STOP\nConfidence: 0.9";
    r.context   = "Weather: cloudy\nTime: day\nRoad: four-lane highway with median";
    r.direction = "Angle: 400\nAction: TURN_RIGHT\nConfidence: .75";
    return r;
}

TEST(MultiCallParserTest, FieldsFoundAnywhere) {
    ParsedResponse r = parse_multi_call_response(make_responses());
    EXPECT_EQ(r.prediction.action, ActionType::Stop);
    EXPECT_DOUBLE_EQ(r.prediction.confidence, 0.9);
    EXPECT_EQ(r.context.weather, WeatherCondition::Cloudy);
    EXPECT_EQ(r.context.road_type, "four-lane highway with median");
    ASSERT_TRUE(r.direction.has_value());
    EXPECT_DOUBLE_EQ(r.direction->angle, 40.0);
    EXPECT_EQ(r.direction->type, ActionType::TurnRight);
    EXPECT_DOUBLE_EQ(r.direction->confidence, 0.75);
}

TEST(MultiCallParserTest, NegativeAngleWraps) {
    MultiCallResponse in = make_responses();
    in.direction = "Angle: -90, Action: TURN_LEFT, Confidence: 0.6";
    ParsedResponse r = parse_multi_call_response(in);
    ASSERT_TRUE(r.direction.has_value());
    EXPECT_DOUBLE_EQ(r.direction->angle, 270.0);
}

TEST(MultiCallParserTest, MissingFieldsReportedTogether) {
    MultiCallResponse in = make_responses();
    in.context = "It looks sunny outside.";
    try {
        parse_multi_call_response(in);
        FAIL() << "expected MalformedResponse";
    } catch (const MalformedResponse& e) {
        EXPECT_EQ(e.scope(), "context");
        EXPECT_EQ(e.got(), "missing Weather:, Time:, Road:");
        EXPECT_EQ(e.raw_content(), in.context);
    }
}

TEST(MultiCallParserTest, DirectionWithoutAngle) {
    MultiCallResponse in = make_responses();
    in.direction = "Action: CONTINUE\nConfidence: 0.5";
    try {
        parse_multi_call_response(in);
        FAIL() << "expected MalformedResponse";
    } catch (const MalformedResponse& e) {
        EXPECT_EQ(e.scope(), "direction");
        EXPECT_EQ(e.got(), "missing Angle:");
    }
}

TEST(MultiCallParserTest, ConfidenceOutOfRange) {
    MultiCallResponse in = make_responses();
    in.action = "Action: STOP\nConfidence: 1.5";
    try {
        parse_multi_call_response(in);
        FAIL() << "expected InvalidConfidence";
    } catch (const InvalidConfidence& e) {
        EXPECT_EQ(e.raw_value(), "1.5");
        EXPECT_EQ(e.raw_content(), in.action);
    }
}

TEST(MultiCallParserTest, UnknownActionInDirection) {
    MultiCallResponse in = make_responses();
    in.direction = "Angle: 10\nAction: DRIFT\nConfidence: 0.5";
    EXPECT_THROW(parse_multi_call_response(in), InvalidEnumValue);
}

TEST(MultiCallParserTest, DispatchThroughVariant) {
    RawResponse raw = make_responses();
    ParsedResponse r = parse_response(raw);
    EXPECT_TRUE(r.direction.has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Long answers
// ─────────────────────────────────────────────────────────────────────────────

TEST(MultiCallParserTest, VeryLongRoadDescription) {
    MultiCallResponse in = make_responses();
    const std::string road(200000, 'a');
    in.context = "Weather: clear\nTime: night\nRoad: " + road + "\nThat is all.";
    ParsedResponse r = parse_multi_call_response(in);
    EXPECT_EQ(r.context.road_type, road);
}

TEST(MultiCallParserTest, VeryLongProseWithoutFields) {
    MultiCallResponse in = make_responses();
    in.action = std::string(200000, 'x');
    try {
        parse_multi_call_response(in);
        FAIL() << "expected MalformedResponse";
    } catch (const MalformedResponse& e) {
        EXPECT_EQ(e.scope(), "action");
        EXPECT_EQ(e.got(), "missing Action:, Confidence:");
    }
}

TEST(MultiCallParserTest, LabelRepeatedWithoutValue) {
    MultiCallResponse in = make_responses();
    std::string noise;
    for (int i = 0; i < 20000; ++i) noise += "Action: ? ";
    in.action = noise + "\nAction: SLOW_DOWN\nConfidence: 0.4";
    ParsedResponse r = parse_multi_call_response(in);
    EXPECT_EQ(r.prediction.action, ActionType::SlowDown);
}

TEST(MultiCallParserTest, OverlongTokenIsMalformed) {
    MultiCallResponse in = make_responses();
    in.action = "Action: " + std::string(200000, 'S') + "\nConfidence: 0.4";
    try {
        parse_multi_call_response(in);
        FAIL() << "expected MalformedResponse";
    } catch (const MalformedResponse& e) {
        EXPECT_EQ(e.scope(), "action");
        EXPECT_EQ(e.raw_content(), in.action);
    }
}

TEST(MultiCallParserTest, TokenAfterLineBreak) {
    MultiCallResponse in = make_responses();
    in.action = "Action:\n  CONTINUE\nConfidence:\t0.3";
    ParsedResponse r = parse_multi_call_response(in);
    EXPECT_EQ(r.prediction.action, ActionType::Continue);
    EXPECT_DOUBLE_EQ(r.prediction.confidence, 0.3);
}
