// src/types/scene_json.cpp

#include "scene_json.hpp"

using json = nlohmann::json;

namespace roadvlm {

void to_json(json& j, ActionType v)        { j = to_string(v); }
void to_json(json& j, ObjectType v)        { j = to_string(v); }
void to_json(json& j, WeatherCondition v)  { j = to_string(v); }
void to_json(json& j, TimeOfDay v)         { j = to_string(v); }
void to_json(json& j, TrafficLightState v) { j = to_string(v); }
void to_json(json& j, CoordinateSpace v)   { j = to_string(v); }

void to_json(json& j, const BoundingBox& b) {
    j = json{{"x_min", b.x_min}, {"y_min", b.y_min}, {"x_max", b.x_max}, {"y_max", b.y_max}};
}

void to_json(json& j, const DetectedObject& o) {
    j = json{
        {"type", o.type},
        {"bbox", o.bbox},
        {"confidence", o.confidence},
        {"coordinate_space", o.space}
    };
    if (o.state) j["state"] = *o.state;
    if (!o.metadata.is_null()) j["metadata"] = o.metadata;
}

void to_json(json& j, const Prediction& p) {
    j = json{{"action", p.action}, {"confidence", p.confidence}};
    if (!p.metadata.is_null()) j["metadata"] = p.metadata;
}

void to_json(json& j, const Direction& d) {
    j = json{{"angle", d.angle}, {"type", d.type}, {"confidence", d.confidence}};
}

void to_json(json& j, const SceneContext& c) {
    j = json{
        {"weather", c.weather},
        {"time_of_day", c.time_of_day},
        {"road_type", c.road_type}
    };
    if (!c.metadata.is_null()) j["metadata"] = c.metadata;
}

void to_json(json& j, const AnalysisOutput& out) {
    j = json::object();
    if (out.prediction) j["prediction"] = *out.prediction;
    j["objects"] = out.objects;
    j["scene_context"] = out.scene_context;
    if (out.direction) j["direction"] = *out.direction;
    if (out.image_id) j["image_id"] = *out.image_id;
    if (out.processing_time) j["processing_time"] = *out.processing_time;
}

void to_json(json& j, const DroppedObject& d) {
    j = json{{"index", d.index}, {"reason", to_string(d.reason)}, {"detail", d.detail}};
}

}  // namespace roadvlm
