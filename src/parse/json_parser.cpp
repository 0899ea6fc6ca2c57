// src/parse/json_parser.cpp

#include "response_parser.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "field_validators.hpp"
#include "model_errors.hpp"

using json = nlohmann::json;

namespace roadvlm {

static std::string require_string(const json& obj, const char* key, const std::string& content) {
    if (!obj.contains(key))
        throw MalformedResponse(std::string("key '") + key + "'", "no such key", content);
    const auto& v = obj[key];
    if (!v.is_string())
        throw MalformedResponse(std::string("'") + key + "' to be a string",
                                v.type_name(), content);
    return v.get<std::string>();
}

static double require_confidence(const json& obj, const char* key, const std::string& content) {
    if (!obj.contains(key))
        throw MalformedResponse(std::string("key '") + key + "'", "no such key", content);
    const auto& v = obj[key];
    if (v.is_number()) {
        double value = v.get<double>();
        if (!(value >= 0.0 && value <= 1.0)) throw InvalidConfidence(v.dump());
        return value;
    }
    if (v.is_string()) return parse_confidence(v.get<std::string>());
    throw InvalidConfidence(v.dump());
}

ParsedResponse parse_json_response(const std::string& raw, const ParserConfig& cfg) {
    const std::string content = trim(raw);
    if (cfg.debug) std::cerr << "[DEBUG] JSON response:\n" << content << "\n";

    json data = json::parse(content, nullptr, false);
    if (data.is_discarded())
        throw MalformedResponse("a JSON object", "unparsable JSON", content);
    if (!data.is_object())
        throw MalformedResponse("a JSON object", data.type_name(), content);

    try {
        const std::string action  = require_string(data, "Action", content);
        const double confidence   = require_confidence(data, "Confidence", content);
        const std::string weather = require_string(data, "Weather", content);
        const std::string time    = require_string(data, "Time", content);
        const std::string road    = require_string(data, "Road", content);

        if (trim(road).empty())
            throw MalformedResponse("a non-empty 'Road' description", "\"\"", content);

        json metadata = nullptr;
        if (data.contains("Metadata") && data["Metadata"].is_object())
            metadata = data["Metadata"];

        Prediction prediction(parse_action(action), confidence, metadata);
        SceneContext context(parse_weather(weather), parse_time_of_day(time), road);
        return ParsedResponse{prediction, context, std::nullopt};
    } catch (ModelOutputError& e) {
        e.attach_raw_content(content);
        throw;
    }
}

}  // namespace roadvlm
