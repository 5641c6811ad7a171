#pragma once

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace sr {
    constexpr int kDefaultNetworkSize = 640;
    constexpr int kLetterboxFill = 128;

    // How a source image was resized and padded into the network input:
    // net = src * scale + offset
    struct LetterboxTransform {
        float scale = 1.0f;
        int offset_x = 0;
        int offset_y = 0;

        int src_w = 0;
        int src_h = 0;
        int resized_w = 0;
        int resized_h = 0;
        int dst_w = kDefaultNetworkSize;
        int dst_h = kDefaultNetworkSize;
    };

    LetterboxTransform make_letterbox(int src_w, int src_h, int dst_w, int dst_h);

    // Aspect-preserving resize centered on a gray dst_w x dst_h canvas.
    cv::Mat to_network_space(const cv::Mat& src,
                             int dst_w,
                             int dst_h,
                             LetterboxTransform& out);

    Box to_network_box(const Box& b, const LetterboxTransform& t);

    // Inverse mapping, clipped to the source image.
    Box from_network_box(const Box& b, const LetterboxTransform& t);
}
