#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <stdexcept>

#include "model_errors.hpp"
#include "scene_json.hpp"
#include "scene_types.hpp"

using namespace roadvlm;
using json = nlohmann::json;

TEST(BoundingBoxTest, ValidBox) {
    BoundingBox b(100, 100, 500, 400);
    EXPECT_EQ(b.width(), 400);
    EXPECT_EQ(b.height(), 300);
    EXPECT_EQ(b.to_rect(), cv::Rect(100, 100, 400, 300));
}

TEST(BoundingBoxTest, RejectsInvertedOrNegative) {
    EXPECT_THROW(BoundingBox(500, 100, 100, 400), std::invalid_argument);
    EXPECT_THROW(BoundingBox(100, 100, 100, 400), std::invalid_argument);
    EXPECT_THROW(BoundingBox(-1, 0, 10, 10), std::invalid_argument);
}

TEST(DetectedObjectTest, ConfidenceOutOfRange) {
    EXPECT_THROW(DetectedObject(ObjectType::Car, BoundingBox(0, 0, 10, 10), 1.2),
                 InvalidConfidence);
}

TEST(DetectedObjectTest, StateOnlyForTrafficLights) {
    DetectedObject light(ObjectType::TrafficLight, BoundingBox(0, 0, 10, 10), 0.9,
                         CoordinateSpace::Millirange, TrafficLightState::Red);
    ASSERT_TRUE(light.state.has_value());
    EXPECT_EQ(*light.state, TrafficLightState::Red);

    EXPECT_THROW(DetectedObject(ObjectType::Bus, BoundingBox(0, 0, 10, 10), 0.9,
                                CoordinateSpace::Millirange, TrafficLightState::Red),
                 std::invalid_argument);
}

TEST(DirectionTest, AngleIsWrapped) {
    EXPECT_DOUBLE_EQ(Direction(400.0, ActionType::TurnRight, 0.7).angle, 40.0);
    EXPECT_DOUBLE_EQ(Direction(-90.0, ActionType::TurnLeft, 0.7).angle, 270.0);
}

TEST(SceneContextTest, BlankRoadRejected) {
    EXPECT_THROW(SceneContext(WeatherCondition::Clear, TimeOfDay::Day, "   "),
                 std::invalid_argument);
    SceneContext ctx(WeatherCondition::Clear, TimeOfDay::Day, "  highway ");
    EXPECT_EQ(ctx.road_type, "highway");
}

TEST(EnumTest, AllowedValuesListEveryToken) {
    EXPECT_EQ(allowed_values<ActionType>(), "STOP, CONTINUE, TURN_LEFT, TURN_RIGHT, SLOW_DOWN");
    EXPECT_EQ(allowed_values<TimeOfDay>(), "day, night, dawn, dusk");
    EXPECT_EQ(allowed_values<ObjectType>(),
              "vehicle, pedestrian, traffic_light, traffic_sign, bus, car");
}

TEST(SceneJsonTest, DetectedObjectSerializesTokens) {
    DetectedObject obj(ObjectType::TrafficLight, BoundingBox(10, 20, 30, 40), 0.8,
                       CoordinateSpace::Pixel, TrafficLightState::Green);
    json j = obj;
    EXPECT_EQ(j["type"], "traffic_light");
    EXPECT_EQ(j["state"], "green");
    EXPECT_EQ(j["coordinate_space"], "pixel");
    EXPECT_EQ(j["bbox"]["x_min"], 10);
    EXPECT_EQ(j["bbox"]["y_max"], 40);
    EXPECT_FALSE(j.contains("metadata"));
}

TEST(SceneJsonTest, AnalysisOutputOmitsAbsentFields) {
    AnalysisOutput out(SceneContext(WeatherCondition::Rainy, TimeOfDay::Night, "urban street"));
    json j = out;
    EXPECT_FALSE(j.contains("prediction"));
    EXPECT_FALSE(j.contains("direction"));
    EXPECT_FALSE(j.contains("image_id"));
    EXPECT_TRUE(j["objects"].is_array());
    EXPECT_EQ(j["scene_context"]["weather"], "rainy");
    EXPECT_EQ(j["scene_context"]["time_of_day"], "night");

    out.prediction.emplace(ActionType::SlowDown, 0.6);
    out.image_id = "frame_0001";
    j = out;
    EXPECT_EQ(j["prediction"]["action"], "SLOW_DOWN");
    EXPECT_EQ(j["image_id"], "frame_0001");
}

TEST(ModelErrorsTest, DiagnosticIncludesRawResponse) {
    MalformedResponse e("4 lines of output", "3 lines", "a\nb\nc");
    EXPECT_EQ(e.kind(), ErrorKind::MalformedResponse);
    EXPECT_EQ(e.diagnostic(),
              "MalformedResponse: expected 4 lines of output, got 3 lines\nResponse:\na\nb\nc");
}

TEST(ModelErrorsTest, AttachKeepsFirstContent) {
    InvalidConfidence e("2");
    e.attach_raw_content("first");
    e.attach_raw_content("second");
    EXPECT_EQ(e.raw_content(), "first");
}

TEST(ModelErrorsTest, ScopedMalformedMessage) {
    MalformedResponse e("Angle:", "missing Angle:", "", "direction");
    EXPECT_EQ(e.scope(), "direction");
    EXPECT_EQ(std::string(e.what()), "direction response: expected Angle:, got missing Angle:");
}
