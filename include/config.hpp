// include/config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace roadvlm {

static const std::string BROKER_ADDRESS = "localhost";
static const int         BROKER_PORT    = 1883;
// every analysis result goes out on one topic
static const std::string TOPIC_NAME     = "road/analysis";
static const std::string CLIENT_ID      = "road-parse";

// normalized [0,1] coordinates are stored as integers scaled by this factor
static constexpr int    MILLIRANGE_SCALE = 1000;

// object boxes narrower/shorter than this (fraction of the image) are noise
static constexpr double MIN_BOX_EXTENT   = 0.01;
// object boxes wider/taller than this are spurious full-image detections
static constexpr double MAX_BOX_EXTENT   = 0.9;

// longest text handed to std::regex in one match; field tokens never come
// close, free text (Road:) is cut without a regex
static constexpr std::size_t MAX_TOKEN_SPAN = 128;

struct ParserConfig {
    double min_box_extent{MIN_BOX_EXTENT};
    double max_box_extent{MAX_BOX_EXTENT};
    bool   debug{false};   // echo raw responses and dropped objects to stderr
};

struct MqttConfig {
    std::string host{BROKER_ADDRESS};
    int         port{BROKER_PORT};
    std::string topic{TOPIC_NAME};
    std::string client_id{CLIENT_ID};
};

struct AppConfig {
    ParserConfig parser;
    MqttConfig   mqtt;
};

// Missing keys keep their defaults.
//   {
//     "parser": { "min_box_extent": 0.01, "max_box_extent": 0.9, "debug": false },
//     "mqtt":   { "host": "localhost", "port": 1883, "topic": "road/analysis" }
//   }
AppConfig config_from_json(const nlohmann::json& cfg);

// Reads a JSON config file. A missing file yields defaults; a file that is
// not valid JSON yields defaults and a warning.
AppConfig load_config(const std::string& path);

}  // namespace roadvlm
