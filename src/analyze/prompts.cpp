// src/analyze/prompts.cpp

#include "road_analyzer.hpp"

namespace roadvlm {

static const char* SCENE_PROMPT = R"(Analyze this driving scene image and respond with ONLY a JSON object in exactly this format.

Focus on key elements:
1. Individual vehicles: give EACH vehicle its own bounding box, never group nearby vehicles.
2. Traffic controls: each traffic light and each traffic sign gets its own bounding box.
3. Road environment: road conditions, weather, time of day.

Required JSON format:
{
    "objects": [
        {
            "type": "vehicle|pedestrian|traffic_light|traffic_sign|bus|car",
            "bbox": [x1, y1, x2, y2],
            "confidence": 0.9
        }
    ],
    "context": {
        "weather": "clear|cloudy|rainy|foggy|snowy",
        "time": "day|night|dawn|dusk",
        "road": "brief road description"
    }
}

Rules:
1. Use normalized coordinates (0-1) for bbox, as precise as possible.
2. Only include objects that are actually visible.
3. Each detection has its own confidence score.)";

static std::string allowed_block() {
    return "Allowed ACTION values: " + allowed_values<ActionType>() + "\n" +
           "Allowed WEATHER values: " + allowed_values<WeatherCondition>() + "\n" +
           "Allowed TIME values: " + allowed_values<TimeOfDay>() + "\n\n";
}

PromptSet default_prompts() {
    const std::string header =
        "Analyze this driving scene and respond using EXACTLY the following format with "
        "EXACTLY these allowed values. Do not use any other values.\n\n";

    PromptSet p;
    p.scene = SCENE_PROMPT;

    p.lines = header + allowed_block() +
              "Required format (four lines):\n"
              "Action: [EXACT ACTION VALUE], Confidence: [NUMBER 0-1]\n"
              "Weather: [EXACT WEATHER VALUE]\n"
              "Time: [EXACT TIME VALUE]\n"
              "Road: [BRIEF DESCRIPTION]";

    p.json = header + allowed_block() +
             "Required format (in JSON):\n"
             "{\n"
             "  \"Action\": \"[EXACT ACTION VALUE]\",\n"
             "  \"Confidence\": [NUMBER 0-1],\n"
             "  \"Weather\": \"[EXACT WEATHER VALUE]\",\n"
             "  \"Time\": \"[EXACT TIME VALUE]\",\n"
             "  \"Road\": \"[BRIEF DESCRIPTION]\"\n"
             "}";

    p.multi_action = "What should the driver do next? Allowed ACTION values: " +
                     allowed_values<ActionType>() +
                     "\nAnswer as:\nAction: [EXACT ACTION VALUE]\nConfidence: [NUMBER 0-1]";

    p.multi_context = "Describe the driving conditions.\nAllowed WEATHER values: " +
                      allowed_values<WeatherCondition>() +
                      "\nAllowed TIME values: " + allowed_values<TimeOfDay>() +
                      "\nAnswer as:\nWeather: [EXACT WEATHER VALUE]\nTime: [EXACT TIME VALUE]\n"
                      "Road: [BRIEF DESCRIPTION]";

    p.multi_direction = "Which way should the vehicle steer? Give the heading in degrees "
                        "(0 = straight ahead, clockwise). Allowed ACTION values: " +
                        allowed_values<ActionType>() +
                        "\nAnswer as:\nAngle: [DEGREES]\nAction: [EXACT ACTION VALUE]\n"
                        "Confidence: [NUMBER 0-1]";
    return p;
}

}  // namespace roadvlm
