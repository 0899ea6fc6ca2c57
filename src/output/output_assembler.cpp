// src/output/output_assembler.cpp

#include "output_assembler.hpp"

#include <utility>

#include "model_errors.hpp"

namespace roadvlm {

AnalysisOutput assemble_output(AssemblyInput input) {
    if (!input.scene_context)
        throw IncompleteOutput("scene_context", "required field is missing");
    if (input.processing_time && *input.processing_time < 0.0)
        throw IncompleteOutput("processing_time", "must be >= 0, got " +
                                                      std::to_string(*input.processing_time));

    AnalysisOutput out(std::move(*input.scene_context));
    out.prediction      = std::move(input.prediction);
    out.objects         = std::move(input.objects);
    out.direction       = std::move(input.direction);
    out.image_id        = std::move(input.image_id);
    out.processing_time = input.processing_time;
    return out;
}

AnalysisOutput assemble_output(const ParsedResponse& parsed,
                               std::vector<DetectedObject> objects,
                               std::optional<std::string> image_id,
                               std::optional<double> processing_time) {
    AssemblyInput input;
    input.prediction      = parsed.prediction;
    input.objects         = std::move(objects);
    input.scene_context   = parsed.context;
    input.direction       = parsed.direction;
    input.image_id        = std::move(image_id);
    input.processing_time = processing_time;
    return assemble_output(std::move(input));
}

}  // namespace roadvlm
