// src/parse/scene_parser.cpp
//
// Scene-analysis dialect:
//   {"objects": [{"type": str, "bbox": [x1,y1,x2,y2], "confidence": num}],
//    "context": {"weather": str, "time": str, "road": str}}
// Object entries are judged one by one: a bad entry is dropped and reported,
// the rest of the response still counts.

#include "response_parser.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "field_validators.hpp"
#include "model_errors.hpp"

using json = nlohmann::json;

namespace roadvlm {

const char* to_string(DropReason r) {
    switch (r) {
        case DropReason::NotAnObject:       return "not_an_object";
        case DropReason::MissingField:      return "missing_field";
        case DropReason::UnknownType:       return "unknown_type";
        case DropReason::InvalidBox:        return "invalid_box";
        case DropReason::InvalidConfidence: return "invalid_confidence";
        case DropReason::InvalidState:      return "invalid_state";
    }
    return "unknown";
}

bool validate_normalized_bbox(const json& bbox, const ParserConfig& cfg, std::string* why) {
    auto reject = [why](const std::string& reason) {
        if (why) *why = reason;
        return false;
    };

    if (!bbox.is_array() || bbox.size() != 4) return reject("expected 4 coordinates");

    double c[4];
    for (int i = 0; i < 4; ++i) {
        if (!bbox[i].is_number()) return reject("coordinate is not a number");
        c[i] = bbox[i].get<double>();
        if (!(c[i] >= 0.0 && c[i] <= 1.0)) return reject("coordinate outside [0,1]");
    }
    if (!(c[0] < c[2] && c[1] < c[3])) return reject("min must be < max on both axes");

    const double width  = c[2] - c[0];
    const double height = c[3] - c[1];
    if (width < cfg.min_box_extent || height < cfg.min_box_extent)
        return reject("box smaller than minimum extent");
    if (width > cfg.max_box_extent || height > cfg.max_box_extent)
        return reject("box larger than maximum extent");
    return true;
}

static int to_millirange(double v) {
    return static_cast<int>(v * MILLIRANGE_SCALE);
}

ObjectParseResult parse_objects(const json& objects, const ParserConfig& cfg) {
    if (!objects.is_array())
        throw MalformedResponse("'objects' to be an array", objects.type_name());

    ObjectParseResult result;
    auto drop = [&](std::size_t index, DropReason reason, const std::string& detail) {
        if (cfg.debug) {
            std::cerr << "[DEBUG] Dropping object #" << index << " (" << to_string(reason)
                      << "): " << detail << "\n";
        }
        result.dropped.push_back(DroppedObject{index, reason, detail});
    };

    for (std::size_t i = 0; i < objects.size(); ++i) {
        const auto& obj = objects[i];
        if (!obj.is_object()) {
            drop(i, DropReason::NotAnObject, obj.dump());
            continue;
        }
        if (!obj.contains("type") || !obj.contains("bbox") || !obj.contains("confidence")) {
            drop(i, DropReason::MissingField, "entry needs type, bbox and confidence");
            continue;
        }

        std::string why;
        if (!validate_normalized_bbox(obj["bbox"], cfg, &why)) {
            drop(i, DropReason::InvalidBox, why + ": " + obj["bbox"].dump());
            continue;
        }

        const auto& type_v = obj["type"];
        if (!type_v.is_string()) {
            drop(i, DropReason::UnknownType, type_v.dump());
            continue;
        }
        ObjectType type;
        try {
            type = parse_object_type(type_v.get<std::string>());
        } catch (const InvalidEnumValue& e) {
            drop(i, DropReason::UnknownType, e.what());
            continue;
        }

        const auto& conf_v = obj["confidence"];
        double confidence = -1.0;
        try {
            if (conf_v.is_number()) {
                confidence = check_confidence(conf_v.get<double>(), conf_v.dump());
            } else if (conf_v.is_string()) {
                confidence = parse_confidence(conf_v.get<std::string>());
            } else {
                throw InvalidConfidence(conf_v.dump());
            }
        } catch (const InvalidConfidence& e) {
            drop(i, DropReason::InvalidConfidence, e.what());
            continue;
        }

        std::optional<TrafficLightState> state;
        if (type == ObjectType::TrafficLight && obj.contains("state") && !obj["state"].is_null()) {
            const auto& state_v = obj["state"];
            try {
                if (!state_v.is_string()) throw InvalidEnumValue("state", state_v.dump(),
                                                                 allowed_values<TrafficLightState>());
                state = parse_traffic_light_state(state_v.get<std::string>());
            } catch (const InvalidEnumValue& e) {
                drop(i, DropReason::InvalidState, e.what());
                continue;
            }
        }

        json metadata = nullptr;
        if (obj.contains("metadata") && obj["metadata"].is_object()) metadata = obj["metadata"];

        const auto& b = obj["bbox"];
        try {
            BoundingBox box(to_millirange(b[0].get<double>()), to_millirange(b[1].get<double>()),
                            to_millirange(b[2].get<double>()), to_millirange(b[3].get<double>()));
            result.objects.emplace_back(type, box, confidence, CoordinateSpace::Millirange,
                                        state, metadata);
        } catch (const std::invalid_argument& e) {
            // extent collapsed to zero when truncated to millirange
            drop(i, DropReason::InvalidBox, e.what());
        }
    }
    return result;
}

SceneContext parse_scene_context(const json& context) {
    if (!context.is_object())
        throw MalformedResponse("'context' to be an object", context.type_name());

    auto field = [&context](const char* key) {
        if (!context.contains(key))
            throw MalformedResponse(std::string("context key '") + key + "'", "no such key");
        const auto& v = context[key];
        if (!v.is_string())
            throw MalformedResponse(std::string("context '") + key + "' to be a string",
                                    v.type_name());
        return v.get<std::string>();
    };

    const std::string weather = field("weather");
    const std::string time    = field("time");
    const std::string road    = field("road");
    if (trim(road).empty())
        throw MalformedResponse("a non-empty context 'road' description", "\"\"");

    json metadata = nullptr;
    if (context.contains("metadata") && context["metadata"].is_object())
        metadata = context["metadata"];

    return SceneContext(parse_weather(weather), parse_time_of_day(time), road, metadata);
}

SceneAnalysis parse_scene_response(const std::string& raw, const ParserConfig& cfg) {
    const std::string content = trim(raw);
    if (cfg.debug) std::cerr << "[DEBUG] Scene response:\n" << content << "\n";

    json data = json::parse(content, nullptr, false);
    if (data.is_discarded())
        throw MalformedResponse("a JSON object", "unparsable JSON", content);
    if (!data.is_object())
        throw MalformedResponse("a JSON object", data.type_name(), content);
    if (!data.contains("context"))
        throw MalformedResponse("required key 'context'", "no such key", content);

    try {
        ObjectParseResult objects;
        if (data.contains("objects")) objects = parse_objects(data["objects"], cfg);

        SceneContext context = parse_scene_context(data["context"]);
        if (cfg.debug && !objects.dropped.empty()) {
            std::cerr << "[DEBUG] Kept " << objects.objects.size() << " objects, dropped "
                      << objects.dropped.size() << "\n";
        }
        return SceneAnalysis{std::move(objects.objects), context, std::move(objects.dropped)};
    } catch (ModelOutputError& e) {
        e.attach_raw_content(content);
        throw;
    }
}

}  // namespace roadvlm
