#pragma once

#include <opencv2/core.hpp>

namespace sr {
    // A loaded object-detection network. Implementations must be safe to call
    // concurrently through a const reference.
    class IDetectionModel {
    public:
        virtual ~IDetectionModel() = default;

        virtual int input_width() const = 0;
        virtual int input_height() const = 0;

        // Input is the letterboxed 8-bit BGR frame of input_width x input_height.
        // Output is CV_32F with one candidate per row:
        // cx, cy, w, h, confidence, class_id (network pixel space).
        virtual cv::Mat infer(const cv::Mat& letterboxed_bgr) const = 0;
    };
}
