// include/response_parser.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "config.hpp"
#include "scene_types.hpp"

namespace roadvlm {

// ─── prediction grammars ────────────────────────
//
// The caller picks the grammar that matches the prompt it sent; content is
// never sniffed. Every parser either returns fully validated records or
// throws a ModelOutputError carrying the raw response.

struct ParsedResponse {
    Prediction prediction;
    SceneContext context;
    std::optional<Direction> direction;   // multi-call grammar only
};

// "Action: X, Confidence: N" / "Weather: X" / "Time: X" / "Road: text"
struct LineResponse {
    std::string content;
};

// {"Action": .., "Confidence": .., "Weather": .., "Time": .., "Road": ..}
struct JsonResponse {
    std::string content;
};

// One free-text answer per sub-query.
struct MultiCallResponse {
    std::string action;
    std::string context;
    std::string direction;
};

using RawResponse = std::variant<LineResponse, JsonResponse, MultiCallResponse>;

enum class ResponseFormat { Lines, Json, MultiCall };

const char* to_string(ResponseFormat f);

// "lines" | "json" | "multi"; throws std::invalid_argument otherwise.
ResponseFormat response_format_from_string(const std::string& s);

ParsedResponse parse_line_response(const std::string& content,
                                   const ParserConfig& cfg = {});
ParsedResponse parse_json_response(const std::string& content,
                                   const ParserConfig& cfg = {});
ParsedResponse parse_multi_call_response(const MultiCallResponse& responses,
                                         const ParserConfig& cfg = {});

// Dispatches on the alternative held by `raw`.
ParsedResponse parse_response(const RawResponse& raw, const ParserConfig& cfg = {});

// ─── scene-analysis grammar ─────────────────────
//
// {"objects": [{"type", "bbox": [x1,y1,x2,y2], "confidence"}],
//  "context": {"weather", "time", "road"}}

enum class DropReason {
    NotAnObject,
    MissingField,
    UnknownType,
    InvalidBox,
    InvalidConfidence,
    InvalidState
};

const char* to_string(DropReason r);

// One object entry that was left out of the result.
struct DroppedObject {
    std::size_t index;    // position in the "objects" array
    DropReason reason;
    std::string detail;
};

struct ObjectParseResult {
    std::vector<DetectedObject> objects;   // millirange coordinates
    std::vector<DroppedObject> dropped;
};

struct SceneAnalysis {
    std::vector<DetectedObject> objects;
    SceneContext context;
    std::vector<DroppedObject> dropped;
};

SceneAnalysis parse_scene_response(const std::string& content,
                                   const ParserConfig& cfg = {});

// Individually malformed entries are dropped and reported; a non-array
// input throws MalformedResponse.
ObjectParseResult parse_objects(const nlohmann::json& objects,
                                const ParserConfig& cfg = {});

SceneContext parse_scene_context(const nlohmann::json& context);

// Geometric check of a normalized [x1,y1,x2,y2] box. On rejection returns
// false and, if `why` is set, a short reason.
bool validate_normalized_bbox(const nlohmann::json& bbox, const ParserConfig& cfg,
                              std::string* why = nullptr);

}  // namespace roadvlm
