// include/road_analyzer.hpp
#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "response_parser.hpp"
#include "scene_types.hpp"

namespace roadvlm {

// External vision-language model. Implementations send the image and prompt
// wherever they like and return the raw text answer.
class SceneModel {
public:
    virtual ~SceneModel() = default;
    virtual std::string query(const std::string& image_path,
                              const std::string& prompt) = 0;
};

struct PromptSet {
    std::string scene;              // scene-analysis JSON dialect
    std::string lines;              // 4-line grammar
    std::string json;               // single JSON object grammar
    std::string multi_action;
    std::string multi_context;
    std::string multi_direction;
};

PromptSet default_prompts();

// Runs the model collaborator and feeds its answers through the parsers.
// Any exception thrown by the collaborator surfaces as ModelInvocationError.
// No timeout or retry: those belong to the caller.
class RoadAnalyzer {
public:
    explicit RoadAnalyzer(SceneModel& model, ParserConfig cfg = {},
                          PromptSet prompts = default_prompts());

    // Objects come back in pixel space when image_size is given, millirange
    // otherwise.
    SceneAnalysis analyze_scene(const std::string& image_path,
                                const std::optional<cv::Size>& image_size = std::nullopt);

    ParsedResponse predict(const std::string& image_path,
                           ResponseFormat format = ResponseFormat::Json);

    // Scene analysis followed by a prediction. The scene context of the
    // result comes from the scene analysis; `dropped` receives the object
    // entries that were rejected.
    AnalysisOutput analyze(const std::string& image_path,
                           const std::optional<std::string>& image_id,
                           const std::optional<cv::Size>& image_size,
                           ResponseFormat format = ResponseFormat::Json,
                           std::vector<DroppedObject>* dropped = nullptr);

private:
    std::string ask(const std::string& image_path, const std::string& prompt,
                    const char* stage);

    SceneModel& model_;
    ParserConfig cfg_;
    PromptSet prompts_;
};

}  // namespace roadvlm
