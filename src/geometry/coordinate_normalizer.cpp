// src/geometry/coordinate_normalizer.cpp

#include "coordinate_normalizer.hpp"

#include <iostream>

#include "config.hpp"

namespace roadvlm {

static int scale_coord(int millirange, int dimension) {
    return static_cast<int>(static_cast<long long>(millirange) * dimension / MILLIRANGE_SCALE);
}

BoundingBox rescale_box(const BoundingBox& box, const cv::Size& target) {
    int x_min = scale_coord(box.x_min, target.width);
    int y_min = scale_coord(box.y_min, target.height);
    int x_max = scale_coord(box.x_max, target.width);
    int y_max = scale_coord(box.y_max, target.height);

    // keep min < max when a narrow box meets a small image
    if (x_max <= x_min) x_max = x_min + 1;
    if (y_max <= y_min) y_max = y_min + 1;
    return BoundingBox(x_min, y_min, x_max, y_max);
}

std::vector<DetectedObject> normalize_coordinates(std::vector<DetectedObject> objects,
                                                  const std::optional<cv::Size>& target) {
    if (!target) return objects;
    if (target->width <= 0 || target->height <= 0) {
        std::cerr << "[WARN] Ignoring non-positive target size " << target->width << "x"
                  << target->height << "\n";
        return objects;
    }

    for (auto& obj : objects) {
        if (obj.space == CoordinateSpace::Pixel) continue;
        obj.bbox  = rescale_box(obj.bbox, *target);
        obj.space = CoordinateSpace::Pixel;
    }
    return objects;
}

}  // namespace roadvlm
