// include/scene_types.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace roadvlm {

// ─── closed value sets ──────────────────────────

enum class ActionType { Stop, Continue, TurnLeft, TurnRight, SlowDown };

enum class ObjectType { Vehicle, Pedestrian, TrafficLight, TrafficSign, Bus, Car };

enum class WeatherCondition { Clear, Rainy, Snowy, Foggy, Cloudy };

enum class TimeOfDay { Day, Night, Dawn, Dusk };

enum class TrafficLightState { Red, Yellow, Green };

// Millirange: integers in [0,1000] (normalized coordinate * 1000).
// Pixel: coordinates of a concrete target image.
enum class CoordinateSpace { Millirange, Pixel };

// Wire tokens: "STOP", "traffic_light", "clear", "dusk", "red", ...
const char* to_string(ActionType v);
const char* to_string(ObjectType v);
const char* to_string(WeatherCondition v);
const char* to_string(TimeOfDay v);
const char* to_string(TrafficLightState v);
const char* to_string(CoordinateSpace v);

// Every variant of E, in declaration order.
template <typename E>
const std::vector<E>& enum_values();

template <> const std::vector<ActionType>& enum_values<ActionType>();
template <> const std::vector<ObjectType>& enum_values<ObjectType>();
template <> const std::vector<WeatherCondition>& enum_values<WeatherCondition>();
template <> const std::vector<TimeOfDay>& enum_values<TimeOfDay>();
template <> const std::vector<TrafficLightState>& enum_values<TrafficLightState>();

// "STOP, CONTINUE, TURN_LEFT, TURN_RIGHT, SLOW_DOWN"
template <typename E>
std::string allowed_values() {
    std::string out;
    for (E v : enum_values<E>()) {
        if (!out.empty()) out += ", ";
        out += to_string(v);
    }
    return out;
}

// ─── entities ───────────────────────────────────

struct BoundingBox {
    int x_min;
    int y_min;
    int x_max;
    int y_max;

    // Throws std::invalid_argument unless 0 <= min < max on both axes.
    BoundingBox(int x_min_, int y_min_, int x_max_, int y_max_);

    int width() const { return x_max - x_min; }
    int height() const { return y_max - y_min; }

    cv::Rect to_rect() const { return cv::Rect(x_min, y_min, width(), height()); }
};

bool operator==(const BoundingBox& a, const BoundingBox& b);
bool operator!=(const BoundingBox& a, const BoundingBox& b);

struct DetectedObject {
    ObjectType type;
    BoundingBox bbox;
    double confidence;
    std::optional<TrafficLightState> state;   // traffic lights only
    nlohmann::json metadata;                  // null when absent
    CoordinateSpace space;

    // Throws InvalidConfidence when confidence is outside [0,1], and
    // std::invalid_argument when a state is given for a non traffic light.
    DetectedObject(ObjectType type_, BoundingBox bbox_, double confidence_,
                   CoordinateSpace space_ = CoordinateSpace::Millirange,
                   std::optional<TrafficLightState> state_ = std::nullopt,
                   nlohmann::json metadata_ = nullptr);
};

struct Prediction {
    ActionType action;
    double confidence;
    nlohmann::json metadata;

    Prediction(ActionType action_, double confidence_,
               nlohmann::json metadata_ = nullptr);
};

// Steering hint from the multi-call grammar. The angle is stored wrapped
// into [0,360).
struct Direction {
    double angle;
    ActionType type;
    double confidence;

    Direction(double angle_, ActionType type_, double confidence_);
};

struct SceneContext {
    WeatherCondition weather;
    TimeOfDay time_of_day;
    std::string road_type;
    nlohmann::json metadata;

    // Throws std::invalid_argument when road_type is blank.
    SceneContext(WeatherCondition weather_, TimeOfDay time_of_day_,
                 std::string road_type_, nlohmann::json metadata_ = nullptr);
};

// Aggregate result for one analyzed image, built by assemble_output().
struct AnalysisOutput {
    std::optional<Prediction> prediction;
    std::vector<DetectedObject> objects;
    SceneContext scene_context;
    std::optional<Direction> direction;
    std::optional<std::string> image_id;
    std::optional<double> processing_time;   // seconds

    explicit AnalysisOutput(SceneContext scene_context_)
        : scene_context(std::move(scene_context_)) {}
};

}  // namespace roadvlm
