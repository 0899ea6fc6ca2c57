// include/field_validators.hpp
#pragma once

#include <string>

#include "scene_types.hpp"

namespace roadvlm {

// Each validator maps one raw token to its closed-set value or throws
// InvalidEnumValue{field, raw, allowed}. No raw response is attached here.

// Case-sensitive: actions are upper-case tokens ("TURN_LEFT").
ActionType parse_action(const std::string& token);

// Case-insensitive.
WeatherCondition parse_weather(const std::string& token);
TimeOfDay parse_time_of_day(const std::string& token);
TrafficLightState parse_traffic_light_state(const std::string& token);

// Case-sensitive, lower-case tokens ("traffic_light").
ObjectType parse_object_type(const std::string& token);

// Accepts "0", "1", "1.0", "0.xxx" and ".xxx". Anything else (negative,
// above one, not a number, longer than MAX_TOKEN_SPAN) throws
// InvalidConfidence.
double parse_confidence(const std::string& token);

// Numeric form for JSON numbers. Throws InvalidConfidence outside [0,1],
// reporting `raw` (the number as it was written) or, without it, the
// shortest decimal form of `value`.
double check_confidence(double value, const std::string& raw);
double check_confidence(double value);

// Wraps degrees into [0,360). Throws std::invalid_argument for NaN/inf.
double normalize_angle(double degrees);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

}  // namespace roadvlm
