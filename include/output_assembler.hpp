// include/output_assembler.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "response_parser.hpp"
#include "scene_types.hpp"

namespace roadvlm {

struct AssemblyInput {
    std::optional<Prediction> prediction;
    std::vector<DetectedObject> objects;
    std::optional<SceneContext> scene_context;
    std::optional<Direction> direction;
    std::optional<std::string> image_id;
    std::optional<double> processing_time;
};

// Throws IncompleteOutput when scene_context is missing or processing_time
// is negative.
AnalysisOutput assemble_output(AssemblyInput input);

// Prediction grammar result plus a separately parsed object list.
AnalysisOutput assemble_output(const ParsedResponse& parsed,
                               std::vector<DetectedObject> objects,
                               std::optional<std::string> image_id = std::nullopt,
                               std::optional<double> processing_time = std::nullopt);

}  // namespace roadvlm
