// src/parse/multi_call_parser.cpp
//
// Three free-text answers, one per sub-query. Fields are found anywhere in
// their answer (searched for, not matched line by line):
//   action    -> Action:, Confidence:
//   context   -> Weather:, Time:, Road:
//   direction -> Angle:, Action:, Confidence:

#include "response_parser.hpp"

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <stdexcept>
#include <vector>

#include "config.hpp"
#include "field_validators.hpp"
#include "model_errors.hpp"

namespace roadvlm {

namespace {

// Token patterns are anchored at the label end and run on a window of at
// most MAX_TOKEN_SPAN characters, never on the whole answer. Road is free
// text up to the end of its line and takes no regex.
struct FieldPattern {
    const char* name;
    std::regex token;
};

const FieldPattern* field_pattern(const std::string& name) {
    static const std::vector<FieldPattern> patterns = {
        {"Action",     std::regex(R"(\s*(\w+))")},
        {"Confidence", std::regex(R"(\s*([-+]?(?:\d+\.?\d*|\.\d+)))")},
        {"Weather",    std::regex(R"(\s*(\w+))")},
        {"Time",       std::regex(R"(\s*(\w+))")},
        {"Angle",      std::regex(R"(\s*([-+]?\d+(?:\.\d+)?))")},
    };
    for (const auto& p : patterns) {
        if (name == p.name) return &p;
    }
    if (name == "Road") return nullptr;
    throw std::logic_error("no pattern for field " + name);
}

// Text after "Road:" up to the end of its line. Blanks before the text may
// be spaces or tabs only.
std::optional<std::string> rest_of_line(const std::string& content, std::size_t start) {
    std::size_t i = start;
    while (i < content.size() && (content[i] == ' ' || content[i] == '\t')) ++i;
    if (i >= content.size() || std::isspace(static_cast<unsigned char>(content[i])))
        return std::nullopt;
    const std::size_t end = content.find_first_of("\r\n", i);
    return trim(content.substr(i, end == std::string::npos ? std::string::npos : end - i));
}

// First occurrence of "<name>:" followed by a well-formed value.
std::optional<std::string> find_field(const std::string& content, const std::string& name,
                                      const char* scope) {
    const FieldPattern* pattern = field_pattern(name);
    const std::string label = name + ":";

    for (std::size_t pos = content.find(label); pos != std::string::npos;
         pos = content.find(label, pos + 1)) {
        const std::size_t start = pos + label.size();
        if (!pattern) {
            auto text = rest_of_line(content, start);
            if (text) return text;
            continue;
        }

        const std::string window = content.substr(start, MAX_TOKEN_SPAN);
        std::smatch m;
        if (!std::regex_search(window, m, pattern->token,
                               std::regex_constants::match_continuous)) {
            continue;
        }
        // a match filling the whole window may have been cut short
        if (static_cast<std::size_t>(m.length(0)) == window.size() &&
            start + window.size() < content.size()) {
            const std::string wider = content.substr(start, MAX_TOKEN_SPAN + 1);
            std::smatch w;
            if (std::regex_search(wider, w, pattern->token,
                                  std::regex_constants::match_continuous) &&
                w.length(0) > m.length(0)) {
                throw MalformedResponse(name + " value of at most " +
                                            std::to_string(MAX_TOKEN_SPAN) + " characters",
                                        "a longer token", content, scope);
            }
        }
        return m[1].str();
    }
    return std::nullopt;
}

// Pulls every requested field out of one sub-query answer. All missing
// fields are reported together.
std::map<std::string, std::string> scan_fields(const std::string& content,
                                               const std::vector<std::string>& fields,
                                               const char* scope) {
    std::map<std::string, std::string> found;
    std::string missing;
    for (const auto& name : fields) {
        if (auto value = find_field(content, name, scope)) {
            found[name] = trim(*value);
        } else {
            if (!missing.empty()) missing += ", ";
            missing += name + ":";
        }
    }
    if (!missing.empty()) {
        std::string expected;
        for (const auto& name : fields) {
            if (!expected.empty()) expected += ", ";
            expected += name + ":";
        }
        throw MalformedResponse(expected, "missing " + missing, content, scope);
    }
    return found;
}

double parse_angle(const std::string& token, const std::string& content) {
    try {
        return normalize_angle(std::stod(token));
    } catch (const std::out_of_range&) {
        throw MalformedResponse("an angle in degrees", "'" + token + "'", content, "direction");
    } catch (const std::invalid_argument&) {
        throw MalformedResponse("an angle in degrees", "'" + token + "'", content, "direction");
    }
}

}  // namespace

ParsedResponse parse_multi_call_response(const MultiCallResponse& responses,
                                         const ParserConfig& cfg) {
    const std::string action_text    = trim(responses.action);
    const std::string context_text   = trim(responses.context);
    const std::string direction_text = trim(responses.direction);

    if (cfg.debug) {
        std::cerr << "[DEBUG] Action response:\n" << action_text << "\n"
                  << "[DEBUG] Context response:\n" << context_text << "\n"
                  << "[DEBUG] Direction response:\n" << direction_text << "\n";
    }

    // action sub-query
    std::optional<Prediction> prediction;
    try {
        auto f = scan_fields(action_text, {"Action", "Confidence"}, "action");
        prediction.emplace(parse_action(f["Action"]), parse_confidence(f["Confidence"]));
    } catch (ModelOutputError& e) {
        e.attach_raw_content(action_text);
        throw;
    }

    // context sub-query
    std::optional<SceneContext> context;
    try {
        auto f = scan_fields(context_text, {"Weather", "Time", "Road"}, "context");
        context.emplace(parse_weather(f["Weather"]), parse_time_of_day(f["Time"]), f["Road"]);
    } catch (ModelOutputError& e) {
        e.attach_raw_content(context_text);
        throw;
    }

    // direction sub-query
    std::optional<Direction> direction;
    try {
        auto f = scan_fields(direction_text, {"Angle", "Action", "Confidence"}, "direction");
        direction.emplace(parse_angle(f["Angle"], direction_text), parse_action(f["Action"]),
                          parse_confidence(f["Confidence"]));
    } catch (ModelOutputError& e) {
        e.attach_raw_content(direction_text);
        throw;
    }

    return ParsedResponse{*prediction, *context, direction};
}

}  // namespace roadvlm
