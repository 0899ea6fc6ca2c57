// src/config/config.cpp

#include "config.hpp"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace roadvlm {

AppConfig config_from_json(const json& cfg) {
    AppConfig out;
    if (!cfg.is_object()) return out;

    if (cfg.contains("parser") && cfg["parser"].is_object()) {
        const auto& p = cfg["parser"];
        out.parser.min_box_extent = p.value("min_box_extent", MIN_BOX_EXTENT);
        out.parser.max_box_extent = p.value("max_box_extent", MAX_BOX_EXTENT);
        out.parser.debug          = p.value("debug", false);
    }

    if (cfg.contains("mqtt") && cfg["mqtt"].is_object()) {
        const auto& m = cfg["mqtt"];
        out.mqtt.host      = m.value("host", BROKER_ADDRESS);
        out.mqtt.port      = m.value("port", BROKER_PORT);
        out.mqtt.topic     = m.value("topic", TOPIC_NAME);
        out.mqtt.client_id = m.value("client_id", CLIENT_ID);
    }
    return out;
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return AppConfig{};

    json cfg;
    try {
        file >> cfg;
    } catch (const json::parse_error& e) {
        std::cerr << "[WARN] Config parse error in " << path << ": " << e.what()
                  << " (using defaults)\n";
        return AppConfig{};
    }

    try {
        return config_from_json(cfg);
    } catch (const json::type_error& e) {
        std::cerr << "[WARN] Config type error in " << path << ": " << e.what()
                  << " (using defaults)\n";
        return AppConfig{};
    }
}

}  // namespace roadvlm
