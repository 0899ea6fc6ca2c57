// include/scene_json.hpp
#pragma once

#include <nlohmann/json.hpp>

#include "response_parser.hpp"
#include "scene_types.hpp"

namespace roadvlm {

// nlohmann ADL hooks. Output only: parsing goes through the validators.

void to_json(nlohmann::json& j, ActionType v);
void to_json(nlohmann::json& j, ObjectType v);
void to_json(nlohmann::json& j, WeatherCondition v);
void to_json(nlohmann::json& j, TimeOfDay v);
void to_json(nlohmann::json& j, TrafficLightState v);
void to_json(nlohmann::json& j, CoordinateSpace v);

void to_json(nlohmann::json& j, const BoundingBox& b);
void to_json(nlohmann::json& j, const DetectedObject& o);
void to_json(nlohmann::json& j, const Prediction& p);
void to_json(nlohmann::json& j, const Direction& d);
void to_json(nlohmann::json& j, const SceneContext& c);
void to_json(nlohmann::json& j, const AnalysisOutput& out);
void to_json(nlohmann::json& j, const DroppedObject& d);

}  // namespace roadvlm
