// include/coordinate_normalizer.hpp
#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

#include "scene_types.hpp"

namespace roadvlm {

// pixel = millirange * dimension / 1000, truncated. A box whose extent would
// truncate to zero is widened to one pixel.
BoundingBox rescale_box(const BoundingBox& box, const cv::Size& target);

// Rescales every millirange object to `target`. Objects already in pixel
// space are left alone, so a second call never rescales twice. Without a
// target (or with a non-positive one) the list is returned unchanged.
std::vector<DetectedObject> normalize_coordinates(std::vector<DetectedObject> objects,
                                                  const std::optional<cv::Size>& target);

}  // namespace roadvlm
