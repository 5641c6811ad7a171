#include <common/letterbox.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace sr {
    LetterboxTransform make_letterbox(int src_w, int src_h, int dst_w, int dst_h) {
        LetterboxTransform t;
        if (dst_w <= 0 || dst_h <= 0) {
            dst_w = kDefaultNetworkSize;
            dst_h = kDefaultNetworkSize;
        }
        t.src_w = std::max(1, src_w);
        t.src_h = std::max(1, src_h);
        t.dst_w = dst_w;
        t.dst_h = dst_h;

        const double sx = static_cast<double>(dst_w) / static_cast<double>(t.src_w);
        const double sy = static_cast<double>(dst_h) / static_cast<double>(t.src_h);
        double s = std::min(sx, sy);
        if (!std::isfinite(s) || s <= 0.0) s = 1.0;
        t.scale = static_cast<float>(s);

        // Small bias keeps exact products like 100 * 0.64 from flooring to 63.
        t.resized_w = std::min(dst_w, std::max(1, static_cast<int>(t.src_w * s + 1e-6)));
        t.resized_h = std::min(dst_h, std::max(1, static_cast<int>(t.src_h * s + 1e-6)));
        t.offset_x = (dst_w - t.resized_w) / 2;
        t.offset_y = (dst_h - t.resized_h) / 2;
        return t;
    }

    cv::Mat to_network_space(const cv::Mat& src,
                             int dst_w,
                             int dst_h,
                             LetterboxTransform& out) {
        out = make_letterbox(src.cols, src.rows, dst_w, dst_h);

        cv::Mat resized;
        cv::resize(src, resized, {out.resized_w, out.resized_h}, 0, 0, cv::INTER_LINEAR);

        cv::Mat canvas(out.dst_h, out.dst_w, src.type(), cv::Scalar::all(kLetterboxFill));
        resized.copyTo(canvas(cv::Rect(out.offset_x, out.offset_y, out.resized_w, out.resized_h)));
        return canvas;
    }

    Box to_network_box(const Box& b, const LetterboxTransform& t) {
        Box n;
        n.x = b.x * t.scale + static_cast<float>(t.offset_x);
        n.y = b.y * t.scale + static_cast<float>(t.offset_y);
        n.w = b.w * t.scale;
        n.h = b.h * t.scale;
        return n;
    }

    Box from_network_box(const Box& b, const LetterboxTransform& t) {
        const float s = t.scale > 0.0f ? t.scale : 1.0f;
        const float src_w = static_cast<float>(t.src_w);
        const float src_h = static_cast<float>(t.src_h);

        const float x1 = (b.x - static_cast<float>(t.offset_x)) / s;
        const float y1 = (b.y - static_cast<float>(t.offset_y)) / s;
        const float x2 = x1 + std::max(0.0f, b.w) / s;
        const float y2 = y1 + std::max(0.0f, b.h) / s;

        Box o;
        o.x = std::min(src_w, std::max(0.0f, x1));
        o.y = std::min(src_h, std::max(0.0f, y1));
        o.w = std::max(0.0f, std::min(src_w, x2) - o.x);
        o.h = std::max(0.0f, std::min(src_h, y2) - o.y);
        return o;
    }
}
