#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <pipeline/types.hpp>

namespace sr {
    // Kernel grows linearly with confidence between the configured bounds,
    // snapped to the nearest odd size and never wider than the region.
    // Expects normalized settings.
    int adaptive_kernel_size(float confidence,
                             const RedactionSettings& settings,
                             int region_w,
                             int region_h);

    // Per-pixel blend weight of the blurred crop (CV_32FC1, w x h).
    // base_weight at the center pixel, rising to 1 at the corners. Higher
    // confidence steepens the rise. Expects normalized settings.
    cv::Mat radial_weight_mask(int region_w,
                               int region_h,
                               float confidence,
                               const RedactionSettings& settings);

    // Blurs every region whose label is enabled. Crops are always taken from
    // the unmodified input, so overlapping regions do not compound.
    // Settings are normalized once here.
    cv::Mat redact_adaptive(const cv::Mat& bgr,
                            const std::vector<Region>& regions,
                            const LabelSet& enabled,
                            const RedactionSettings& settings);

    // Plain gaussian blur of each rect at a fixed kernel (forced odd, >= 3).
    cv::Mat blur_fixed(const cv::Mat& bgr,
                       const std::vector<cv::Rect>& rects,
                       int kernel);
}
