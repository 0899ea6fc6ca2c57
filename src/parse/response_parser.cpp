// src/parse/response_parser.cpp

#include "response_parser.hpp"

#include <stdexcept>
#include <type_traits>

namespace roadvlm {

const char* to_string(ResponseFormat f) {
    switch (f) {
        case ResponseFormat::Lines:     return "lines";
        case ResponseFormat::Json:      return "json";
        case ResponseFormat::MultiCall: return "multi";
    }
    return "";
}

ResponseFormat response_format_from_string(const std::string& s) {
    if (s == "lines") return ResponseFormat::Lines;
    if (s == "json")  return ResponseFormat::Json;
    if (s == "multi") return ResponseFormat::MultiCall;
    throw std::invalid_argument("unknown response format '" + s + "' (lines|json|multi)");
}

ParsedResponse parse_response(const RawResponse& raw, const ParserConfig& cfg) {
    return std::visit(
        [&cfg](const auto& r) -> ParsedResponse {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, LineResponse>) {
                return parse_line_response(r.content, cfg);
            } else if constexpr (std::is_same_v<T, JsonResponse>) {
                return parse_json_response(r.content, cfg);
            } else {
                return parse_multi_call_response(r, cfg);
            }
        },
        raw);
}

}  // namespace roadvlm
