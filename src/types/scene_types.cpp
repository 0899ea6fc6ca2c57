// src/types/scene_types.cpp

#include "scene_types.hpp"

#include <stdexcept>
#include <utility>

#include "field_validators.hpp"
#include "model_errors.hpp"

namespace roadvlm {

const char* to_string(ActionType v) {
    switch (v) {
        case ActionType::Stop:      return "STOP";
        case ActionType::Continue:  return "CONTINUE";
        case ActionType::TurnLeft:  return "TURN_LEFT";
        case ActionType::TurnRight: return "TURN_RIGHT";
        case ActionType::SlowDown:  return "SLOW_DOWN";
    }
    return "";
}

const char* to_string(ObjectType v) {
    switch (v) {
        case ObjectType::Vehicle:      return "vehicle";
        case ObjectType::Pedestrian:   return "pedestrian";
        case ObjectType::TrafficLight: return "traffic_light";
        case ObjectType::TrafficSign:  return "traffic_sign";
        case ObjectType::Bus:          return "bus";
        case ObjectType::Car:          return "car";
    }
    return "";
}

const char* to_string(WeatherCondition v) {
    switch (v) {
        case WeatherCondition::Clear:  return "clear";
        case WeatherCondition::Rainy:  return "rainy";
        case WeatherCondition::Snowy:  return "snowy";
        case WeatherCondition::Foggy:  return "foggy";
        case WeatherCondition::Cloudy: return "cloudy";
    }
    return "";
}

const char* to_string(TimeOfDay v) {
    switch (v) {
        case TimeOfDay::Day:   return "day";
        case TimeOfDay::Night: return "night";
        case TimeOfDay::Dawn:  return "dawn";
        case TimeOfDay::Dusk:  return "dusk";
    }
    return "";
}

const char* to_string(TrafficLightState v) {
    switch (v) {
        case TrafficLightState::Red:    return "red";
        case TrafficLightState::Yellow: return "yellow";
        case TrafficLightState::Green:  return "green";
    }
    return "";
}

const char* to_string(CoordinateSpace v) {
    switch (v) {
        case CoordinateSpace::Millirange: return "millirange";
        case CoordinateSpace::Pixel:      return "pixel";
    }
    return "";
}

template <>
const std::vector<ActionType>& enum_values<ActionType>() {
    static const std::vector<ActionType> values = {
        ActionType::Stop, ActionType::Continue, ActionType::TurnLeft,
        ActionType::TurnRight, ActionType::SlowDown};
    return values;
}

template <>
const std::vector<ObjectType>& enum_values<ObjectType>() {
    static const std::vector<ObjectType> values = {
        ObjectType::Vehicle, ObjectType::Pedestrian, ObjectType::TrafficLight,
        ObjectType::TrafficSign, ObjectType::Bus, ObjectType::Car};
    return values;
}

template <>
const std::vector<WeatherCondition>& enum_values<WeatherCondition>() {
    static const std::vector<WeatherCondition> values = {
        WeatherCondition::Clear, WeatherCondition::Rainy, WeatherCondition::Snowy,
        WeatherCondition::Foggy, WeatherCondition::Cloudy};
    return values;
}

template <>
const std::vector<TimeOfDay>& enum_values<TimeOfDay>() {
    static const std::vector<TimeOfDay> values = {
        TimeOfDay::Day, TimeOfDay::Night, TimeOfDay::Dawn, TimeOfDay::Dusk};
    return values;
}

template <>
const std::vector<TrafficLightState>& enum_values<TrafficLightState>() {
    static const std::vector<TrafficLightState> values = {
        TrafficLightState::Red, TrafficLightState::Yellow, TrafficLightState::Green};
    return values;
}

// ─── entities ───────────────────────────────────

BoundingBox::BoundingBox(int x_min_, int y_min_, int x_max_, int y_max_)
    : x_min(x_min_), y_min(y_min_), x_max(x_max_), y_max(y_max_) {
    if (x_min_ < 0 || y_min_ < 0)
        throw std::invalid_argument("BoundingBox: coordinates must be non-negative");
    if (x_min_ >= x_max_)
        throw std::invalid_argument("BoundingBox: x_min must be < x_max");
    if (y_min_ >= y_max_)
        throw std::invalid_argument("BoundingBox: y_min must be < y_max");
}

bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.x_min == b.x_min && a.y_min == b.y_min &&
           a.x_max == b.x_max && a.y_max == b.y_max;
}

bool operator!=(const BoundingBox& a, const BoundingBox& b) {
    return !(a == b);
}

DetectedObject::DetectedObject(ObjectType type_, BoundingBox bbox_, double confidence_,
                               CoordinateSpace space_,
                               std::optional<TrafficLightState> state_,
                               nlohmann::json metadata_)
    : type(type_),
      bbox(bbox_),
      confidence(check_confidence(confidence_)),
      state(state_),
      metadata(std::move(metadata_)),
      space(space_) {
    if (state_ && type_ != ObjectType::TrafficLight)
        throw std::invalid_argument("DetectedObject: state is only valid for traffic lights");
}

Prediction::Prediction(ActionType action_, double confidence_, nlohmann::json metadata_)
    : action(action_),
      confidence(check_confidence(confidence_)),
      metadata(std::move(metadata_)) {}

Direction::Direction(double angle_, ActionType type_, double confidence_)
    : angle(normalize_angle(angle_)),
      type(type_),
      confidence(check_confidence(confidence_)) {}

SceneContext::SceneContext(WeatherCondition weather_, TimeOfDay time_of_day_,
                           std::string road_type_, nlohmann::json metadata_)
    : weather(weather_),
      time_of_day(time_of_day_),
      road_type(trim(road_type_)),
      metadata(std::move(metadata_)) {
    if (road_type.empty())
        throw std::invalid_argument("SceneContext: road_type must not be empty");
}

}  // namespace roadvlm
