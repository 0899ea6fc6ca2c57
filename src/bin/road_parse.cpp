// src/bin/road_parse.cpp
//
// Turns saved model responses into one validated AnalysisOutput (JSON on
// stdout), optionally publishing it over MQTT.

#include <mosquitto.h>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "config.hpp"
#include "coordinate_normalizer.hpp"
#include "model_errors.hpp"
#include "mqtt_utils.hpp"
#include "output_assembler.hpp"
#include "response_parser.hpp"
#include "scene_json.hpp"

using json = nlohmann::json;

struct CliOptions {
    std::string format{"json"};             // lines | json | multi | scene
    std::string input;
    std::string action_file;
    std::string context_file;
    std::string direction_file;
    std::string prediction_file;            // scene format only
    std::string prediction_format{"json"};  // lines | json
    std::string image_path;
    std::string size;                       // WxH
    std::optional<std::string> image_id;
    std::string config_path;
    bool debug{false};
    bool mqtt{false};
};

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static void print_usage() {
    std::cout << "Usage: road_parse --format lines|json|multi|scene [--input <file>]\n"
              << "                  [--action <file> --context <file> --direction <file>]\n"
              << "                  [--prediction <file> --prediction-format lines|json]\n"
              << "                  [--image <path> | --size <WxH>] [--image-id <id>]\n"
              << "                  [--config <json>] [--debug] [--mqtt]\n";
}

static CliOptions parse_args(int argc, char** argv) {
    CliOptions opt;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* { return (i + 1 < argc) ? argv[i + 1] : nullptr; };

        if (arg_eq(arg, "--format") && next()) {
            opt.format = next(); i++;
        } else if (arg_eq(arg, "--input") && next()) {
            opt.input = next(); i++;
        } else if (arg_eq(arg, "--action") && next()) {
            opt.action_file = next(); i++;
        } else if (arg_eq(arg, "--context") && next()) {
            opt.context_file = next(); i++;
        } else if (arg_eq(arg, "--direction") && next()) {
            opt.direction_file = next(); i++;
        } else if (arg_eq(arg, "--prediction") && next()) {
            opt.prediction_file = next(); i++;
        } else if (arg_eq(arg, "--prediction-format") && next()) {
            opt.prediction_format = next(); i++;
        } else if (arg_eq(arg, "--image") && next()) {
            opt.image_path = next(); i++;
        } else if (arg_eq(arg, "--size") && next()) {
            opt.size = next(); i++;
        } else if (arg_eq(arg, "--image-id") && next()) {
            opt.image_id = std::string(next()); i++;
        } else if (arg_eq(arg, "--config") && next()) {
            opt.config_path = next(); i++;
        } else if (arg_eq(arg, "--debug")) {
            opt.debug = true;
        } else if (arg_eq(arg, "--mqtt")) {
            opt.mqtt = true;
        } else if (arg_eq(arg, "--help")) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << "\n";
        }
    }
    return opt;
}

static bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[ERROR] Unable to open response file: " << path << "\n";
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// --size WxH, or the dimensions of --image
static bool resolve_target(const CliOptions& opt, std::optional<cv::Size>& target) {
    if (!opt.size.empty()) {
        int w = 0, h = 0;
        if (std::sscanf(opt.size.c_str(), "%dx%d", &w, &h) != 2 || w <= 0 || h <= 0) {
            std::cerr << "[ERROR] Invalid --size '" << opt.size << "', expected WxH\n";
            return false;
        }
        target = cv::Size(w, h);
        return true;
    }
    if (!opt.image_path.empty()) {
        cv::Mat img = cv::imread(opt.image_path, cv::IMREAD_UNCHANGED);
        if (img.empty()) {
            std::cerr << "[ERROR] Unable to read image: " << opt.image_path << "\n";
            return false;
        }
        target = img.size();
        std::cerr << "[INFO] Target size from " << opt.image_path << ": "
                  << img.cols << "x" << img.rows << "\n";
    }
    return true;
}

static roadvlm::ParsedResponse parse_prediction(const std::string& format,
                                                const std::string& content,
                                                const roadvlm::ParserConfig& cfg) {
    switch (roadvlm::response_format_from_string(format)) {
        case roadvlm::ResponseFormat::Lines:
            return roadvlm::parse_response(roadvlm::LineResponse{content}, cfg);
        case roadvlm::ResponseFormat::Json:
            return roadvlm::parse_response(roadvlm::JsonResponse{content}, cfg);
        case roadvlm::ResponseFormat::MultiCall:
            break;
    }
    throw std::invalid_argument("format '" + format + "' needs --action/--context/--direction");
}

static bool publish(const roadvlm::MqttConfig& mc, const roadvlm::AnalysisOutput& out) {
    mosquitto_lib_init();
    auto mosq = mosquitto_new(mc.client_id.c_str(), true, nullptr);
    if (!mosq) {
        std::cerr << "[ERROR] Failed to create MQTT client\n";
        mosquitto_lib_cleanup();
        return false;
    }
    bool ok = false;
    if (mosquitto_connect(mosq, mc.host.c_str(), mc.port, 60) != MOSQ_ERR_SUCCESS) {
        std::cerr << "[ERROR] Failed to connect broker " << mc.host << ":" << mc.port << "\n";
    } else {
        mosquitto_loop_start(mosq);
        ok = roadvlm::publish_analysis(mosq, mc.topic, out);
        mosquitto_disconnect(mosq);
        mosquitto_loop_stop(mosq, false);
    }
    mosquitto_destroy(mosq);
    mosquitto_lib_cleanup();
    return ok;
}

int main(int argc, char** argv) {
    CliOptions opt = parse_args(argc, argv);

    roadvlm::AppConfig cfg;
    if (!opt.config_path.empty()) cfg = roadvlm::load_config(opt.config_path);
    if (opt.debug) cfg.parser.debug = true;

    std::optional<cv::Size> target;
    if (!resolve_target(opt, target)) return 1;

    auto t0 = std::chrono::steady_clock::now();
    std::optional<roadvlm::AnalysisOutput> output;

    try {
        if (opt.format == "scene") {
            std::string content;
            if (!read_file(opt.input, content)) return 1;

            roadvlm::SceneAnalysis scene = roadvlm::parse_scene_response(content, cfg.parser);
            for (const auto& d : scene.dropped) {
                std::cerr << "[WARN] Dropped object #" << d.index << " ("
                          << roadvlm::to_string(d.reason) << "): " << d.detail << "\n";
            }

            roadvlm::AssemblyInput input;
            input.objects       = roadvlm::normalize_coordinates(std::move(scene.objects), target);
            input.scene_context = scene.context;
            input.image_id      = opt.image_id;

            if (!opt.prediction_file.empty()) {
                std::string pred_content;
                if (!read_file(opt.prediction_file, pred_content)) return 1;
                input.prediction =
                    parse_prediction(opt.prediction_format, pred_content, cfg.parser).prediction;
            }

            input.processing_time =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            output = roadvlm::assemble_output(std::move(input));
        } else {
            roadvlm::ParsedResponse parsed = [&]() {
                if (opt.format == "multi") {
                    roadvlm::MultiCallResponse r;
                    if (!read_file(opt.action_file, r.action) ||
                        !read_file(opt.context_file, r.context) ||
                        !read_file(opt.direction_file, r.direction)) {
                        std::exit(1);
                    }
                    return roadvlm::parse_response(r, cfg.parser);
                }
                std::string content;
                if (!read_file(opt.input, content)) std::exit(1);
                return parse_prediction(opt.format, content, cfg.parser);
            }();

            double elapsed =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            output = roadvlm::assemble_output(parsed, {}, opt.image_id, elapsed);
        }
    } catch (const roadvlm::ModelOutputError& e) {
        std::cerr << "[ERROR] " << e.diagnostic() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        print_usage();
        return 1;
    }

    json j = *output;
    std::cout << j.dump(2) << std::endl;

    if (opt.mqtt && !publish(cfg.mqtt, *output)) return 1;
    return 0;
}
