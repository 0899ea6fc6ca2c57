// include/mqtt_utils.hpp
#pragma once
#include <mosquitto.h>
#include <nlohmann/json.hpp>
#include <ctime>
#include <iostream>
#include <string>
#include "config.hpp"
#include "scene_json.hpp"

namespace roadvlm {

inline std::string now_iso_local() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%FT%T", &tm);
    return std::string(buf);
}

// Publishes one analysis result as {"timestamp", "analysis"} on `topic`.
inline bool publish_analysis(struct mosquitto* mosq, const std::string& topic,
                             const AnalysisOutput& output) {
    nlohmann::json payload = {
        {"timestamp", now_iso_local()},
        {"analysis", output}
    };
    auto msg = payload.dump();
    int rc = mosquitto_publish(mosq, nullptr,
                               topic.c_str(),
                               static_cast<int>(msg.size()), msg.c_str(),
                               1, false);
    if (rc != MOSQ_ERR_SUCCESS) {
        std::cerr << "[ERROR] MQTT publish failed: " << mosquitto_strerror(rc) << "\n";
        return false;
    }
    std::cout << "[INFO] MQTT published on " << topic << " (" << msg.size() << " bytes)\n";
    return true;
}

}  // namespace roadvlm
