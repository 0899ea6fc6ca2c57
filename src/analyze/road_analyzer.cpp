// src/analyze/road_analyzer.cpp

#include "road_analyzer.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "coordinate_normalizer.hpp"
#include "model_errors.hpp"
#include "output_assembler.hpp"

namespace roadvlm {

RoadAnalyzer::RoadAnalyzer(SceneModel& model, ParserConfig cfg, PromptSet prompts)
    : model_(model), cfg_(cfg), prompts_(std::move(prompts)) {}

std::string RoadAnalyzer::ask(const std::string& image_path, const std::string& prompt,
                              const char* stage) {
    try {
        return model_.query(image_path, prompt);
    } catch (const ModelOutputError&) {
        throw;
    } catch (const std::exception& e) {
        throw ModelInvocationError(stage, e.what());
    } catch (...) {
        throw ModelInvocationError(stage, "unknown error");
    }
}

SceneAnalysis RoadAnalyzer::analyze_scene(const std::string& image_path,
                                          const std::optional<cv::Size>& image_size) {
    const std::string content = ask(image_path, prompts_.scene, "scene analysis");
    SceneAnalysis scene = parse_scene_response(content, cfg_);
    scene.objects = normalize_coordinates(std::move(scene.objects), image_size);

    if (!scene.dropped.empty()) {
        std::cerr << "[WARN] " << image_path << ": dropped " << scene.dropped.size()
                  << " of " << scene.objects.size() + scene.dropped.size() << " objects\n";
    }
    return scene;
}

ParsedResponse RoadAnalyzer::predict(const std::string& image_path, ResponseFormat format) {
    switch (format) {
        case ResponseFormat::Lines:
            return parse_response(LineResponse{ask(image_path, prompts_.lines, "prediction")},
                                  cfg_);
        case ResponseFormat::Json:
            return parse_response(JsonResponse{ask(image_path, prompts_.json, "prediction")},
                                  cfg_);
        case ResponseFormat::MultiCall: {
            MultiCallResponse r;
            r.action    = ask(image_path, prompts_.multi_action, "action query");
            r.context   = ask(image_path, prompts_.multi_context, "context query");
            r.direction = ask(image_path, prompts_.multi_direction, "direction query");
            return parse_response(r, cfg_);
        }
    }
    throw std::invalid_argument("unknown response format");
}

AnalysisOutput RoadAnalyzer::analyze(const std::string& image_path,
                                     const std::optional<std::string>& image_id,
                                     const std::optional<cv::Size>& image_size,
                                     ResponseFormat format,
                                     std::vector<DroppedObject>* dropped) {
    auto t0 = std::chrono::steady_clock::now();

    SceneAnalysis scene = analyze_scene(image_path, image_size);
    ParsedResponse parsed = predict(image_path, format);

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (dropped) *dropped = scene.dropped;

    AssemblyInput input;
    input.prediction      = parsed.prediction;
    input.objects         = std::move(scene.objects);
    input.scene_context   = scene.context;
    input.direction       = parsed.direction;
    input.image_id        = image_id;
    input.processing_time = elapsed;
    return assemble_output(std::move(input));
}

}  // namespace roadvlm
