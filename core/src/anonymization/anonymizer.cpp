#include <anonymization/anonymizer.hpp>

#include <algorithm>
#include <cmath>

#include <opencv2/imgproc.hpp>

namespace sr {
    namespace {
        float clamp01(float v) {
            if (!std::isfinite(v)) return 0.0f;
            return std::min(1.0f, std::max(0.0f, v));
        }

        cv::Mat blend_(const cv::Mat& orig, const cv::Mat& blurred, const cv::Mat& weight) {
            cv::Mat orig_f;
            cv::Mat blur_f;
            orig.convertTo(orig_f, CV_32F);
            blurred.convertTo(blur_f, CV_32F);

            cv::Mat w3;
            cv::merge(std::vector<cv::Mat>{weight, weight, weight}, w3);
            cv::Mat inv;
            cv::subtract(cv::Scalar::all(1.0), w3, inv);

            cv::Mat mixed = blur_f.mul(w3) + orig_f.mul(inv);
            cv::Mat out;
            mixed.convertTo(out, orig.type());
            return out;
        }
    } // namespace

    int adaptive_kernel_size(float confidence,
                             const RedactionSettings& settings,
                             int region_w,
                             int region_h) {
        const float c = clamp01(confidence);

        const float k = static_cast<float>(settings.min_kernel_size) +
                        static_cast<float>(settings.max_kernel_size - settings.min_kernel_size) * c;
        int kernel = 2 * static_cast<int>(std::lround((k - 1.0f) * 0.5f)) + 1;
        kernel = std::min(settings.max_kernel_size, std::max(settings.min_kernel_size, kernel));

        const int smaller = std::min(region_w, region_h);
        const int cap = (smaller % 2 == 0) ? smaller - 1 : smaller;
        kernel = std::min(kernel, cap);
        return std::max(3, kernel);
    }

    cv::Mat radial_weight_mask(int region_w,
                               int region_h,
                               float confidence,
                               const RedactionSettings& settings) {
        cv::Mat mask(std::max(0, region_h), std::max(0, region_w), CV_32F);
        if (mask.empty()) return mask;

        const float focus = settings.focus_exponent * (1.0f + clamp01(confidence));
        const float base = settings.base_weight;

        // The center is a real pixel for both odd and even sizes, so d == 0
        // is always reached. Half extents cover the farther edge.
        const int cx = region_w / 2;
        const int cy = region_h / 2;
        const float hx = static_cast<float>(std::max(cx, region_w - 1 - cx));
        const float hy = static_cast<float>(std::max(cy, region_h - 1 - cy));
        const float kCornerNorm = 1.0f / std::sqrt(2.0f);

        for (int y = 0; y < region_h; ++y) {
            float* row = mask.ptr<float>(y);
            const float dy = hy > 0.0f ? static_cast<float>(y - cy) / hy : 0.0f;
            for (int x = 0; x < region_w; ++x) {
                const float dx = hx > 0.0f ? static_cast<float>(x - cx) / hx : 0.0f;
                const float d = std::sqrt(dx * dx + dy * dy) * kCornerNorm;
                const float radial = std::pow(clamp01(1.0f - d), focus);
                row[x] = base + (1.0f - base) * (1.0f - radial);
            }
        }
        return mask;
    }

    cv::Mat redact_adaptive(const cv::Mat& bgr,
                            const std::vector<Region>& regions,
                            const LabelSet& enabled,
                            const RedactionSettings& settings) {
        cv::Mat out = bgr.clone();
        if (bgr.empty()) return out;

        const RedactionSettings s = settings.normalized();
        for (const auto& region : regions) {
            if (enabled.count(region.label) == 0) continue;

            const cv::Rect roi = to_pixel_rect(region.box, bgr.cols, bgr.rows);
            if (roi.width <= 0 || roi.height <= 0) continue;

            const cv::Mat crop = bgr(roi);
            const int k = adaptive_kernel_size(region.confidence, s, roi.width, roi.height);

            cv::Mat blurred;
            cv::GaussianBlur(crop.clone(), blurred, cv::Size(k, k), 0.0, 0.0);

            const cv::Mat weight = radial_weight_mask(roi.width, roi.height, region.confidence, s);
            blend_(crop, blurred, weight).copyTo(out(roi));
        }
        return out;
    }

    cv::Mat blur_fixed(const cv::Mat& bgr,
                       const std::vector<cv::Rect>& rects,
                       int kernel) {
        cv::Mat out = bgr.clone();
        if (bgr.empty()) return out;

        const int k = odd_kernel(kernel);
        const cv::Rect bounds(0, 0, bgr.cols, bgr.rows);
        for (const auto& r : rects) {
            const cv::Rect roi = r & bounds;
            if (roi.width <= 0 || roi.height <= 0) continue;

            cv::Mat blurred;
            cv::GaussianBlur(bgr(roi).clone(), blurred, cv::Size(k, k), 0.0, 0.0);
            blurred.copyTo(out(roi));
        }
        return out;
    }
}
