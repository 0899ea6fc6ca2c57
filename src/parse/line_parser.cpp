// src/parse/line_parser.cpp
//
// Strict four-line grammar:
//   Action: <TOKEN>, Confidence: <NUM>
//   Weather: <TOKEN>
//   Time: <TOKEN>
//   Road: <free text>

#include "response_parser.hpp"

#include <iostream>
#include <regex>
#include <sstream>
#include <vector>

#include "config.hpp"
#include "field_validators.hpp"
#include "model_errors.hpp"

namespace roadvlm {

// non-empty lines, trimmed
static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

// first characters of a line for error messages
static std::string excerpt(const std::string& line) {
    if (line.size() <= 60) return "'" + line + "'";
    return "'" + line.substr(0, 60) + "...' (" + std::to_string(line.size()) + " characters)";
}

// Token lines are short; a longer line is rejected before it reaches std::regex.
static std::smatch match_line(const std::string& line, const std::regex& pat,
                              const char* expected, const std::string& content) {
    std::smatch m;
    if (line.size() > MAX_TOKEN_SPAN || !std::regex_match(line, m, pat))
        throw MalformedResponse(expected, excerpt(line), content);
    return m;
}

// "Road: <free text>", taken without a regex so its length is unbounded
static std::string road_text(const std::string& line, const std::string& content) {
    static const char* expected = "'Road: <description>'";
    if (line.compare(0, 5, "Road:") != 0)
        throw MalformedResponse(expected, excerpt(line), content);
    std::string road = trim(line.substr(5));
    if (road.empty()) throw MalformedResponse(expected, excerpt(line), content);
    return road;
}

ParsedResponse parse_line_response(const std::string& raw, const ParserConfig& cfg) {
    const std::string content = trim(raw);
    if (cfg.debug) std::cerr << "[DEBUG] Line response:\n" << content << "\n";

    static const std::regex action_pat(R"(^Action:\s*(\w+),\s*Confidence:\s*(\S+)$)");
    static const std::regex weather_pat(R"(^Weather:\s*(\w+)$)");
    static const std::regex time_pat(R"(^Time:\s*(\w+)$)");

    const auto lines = split_lines(content);
    if (lines.size() != 4) {
        throw MalformedResponse("4 lines of output",
                                std::to_string(lines.size()) + " lines", content);
    }

    try {
        auto action_m  = match_line(lines[0], action_pat,
                                    "'Action: <ACTION>, Confidence: <0-1>'", content);
        auto weather_m = match_line(lines[1], weather_pat, "'Weather: <WEATHER>'", content);
        auto time_m    = match_line(lines[2], time_pat, "'Time: <TIME>'", content);
        std::string road = road_text(lines[3], content);

        Prediction prediction(parse_action(action_m[1].str()),
                              parse_confidence(action_m[2].str()));
        SceneContext context(parse_weather(weather_m[1].str()),
                             parse_time_of_day(time_m[1].str()),
                             road);
        return ParsedResponse{prediction, context, std::nullopt};
    } catch (ModelOutputError& e) {
        e.attach_raw_content(content);
        throw;
    }
}

}  // namespace roadvlm
