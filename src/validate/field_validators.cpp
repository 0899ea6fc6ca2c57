// src/validate/field_validators.cpp

#include "field_validators.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "config.hpp"
#include "model_errors.hpp"

namespace roadvlm {

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end   = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

template <typename E>
static E match_token(const char* field, const std::string& token, bool ignore_case) {
    const std::string key = ignore_case ? to_lower(token) : token;
    for (E v : enum_values<E>()) {
        if (key == to_string(v)) return v;
    }
    throw InvalidEnumValue(field, token, allowed_values<E>());
}

ActionType parse_action(const std::string& token) {
    return match_token<ActionType>("action", token, false);
}

WeatherCondition parse_weather(const std::string& token) {
    return match_token<WeatherCondition>("weather", token, true);
}

TimeOfDay parse_time_of_day(const std::string& token) {
    return match_token<TimeOfDay>("time_of_day", token, true);
}

TrafficLightState parse_traffic_light_state(const std::string& token) {
    return match_token<TrafficLightState>("state", token, true);
}

ObjectType parse_object_type(const std::string& token) {
    return match_token<ObjectType>("type", token, false);
}

double parse_confidence(const std::string& token) {
    static const std::regex pat(R"(^(0(\.\d+)?|0?\.\d+|1(\.0+)?)$)");
    if (token.size() > MAX_TOKEN_SPAN || !std::regex_match(token, pat))
        throw InvalidConfidence(token);
    return std::stod(token);
}

double check_confidence(double value, const std::string& raw) {
    if (!(value >= 0.0 && value <= 1.0)) throw InvalidConfidence(raw);
    return value;
}

// shortest text that reads back as `value`
static std::string number_text(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";
    return nlohmann::json(value).dump();
}

double check_confidence(double value) {
    return check_confidence(value, number_text(value));
}

double normalize_angle(double degrees) {
    if (!std::isfinite(degrees))
        throw std::invalid_argument("angle must be a finite number of degrees");
    double a = std::fmod(degrees, 360.0);
    if (a < 0.0) a += 360.0;
    // fmod of a tiny negative value can round back up to exactly 360
    if (a >= 360.0) a = 0.0;
    return a;
}

}  // namespace roadvlm
