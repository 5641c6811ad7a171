#include <pipeline/report.hpp>

#include <cstdio>
#include <string>

#include <opencv2/imgproc.hpp>

namespace sr {
    namespace {
        std::string fmt(double v, int digits) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
            return buf;
        }

        cv::Scalar color_for(Label label) {
            switch (label) {
                case Label::Face: return {0, 255, 0};
                case Label::LicensePlate: return {255, 0, 0};
                default: return {0, 255, 255};
            }
        }
    } // namespace

    std::string report_to_json(const DetectionReport& report) {
        std::string regions = "[";
        for (size_t i = 0; i < report.regions.size(); ++i) {
            const Region& r = report.regions[i];
            if (i > 0) regions += ",";
            regions +=
                "{"
                "\"class_name\":\"" + region_name(r) + "\","
                "\"confidence\":" + fmt(r.confidence, 4) + ","
                "\"bbox\":{"
                "\"x\":" + fmt(r.box.x, 1) + ","
                "\"y\":" + fmt(r.box.y, 1) + ","
                "\"width\":" + fmt(r.box.w, 1) + ","
                "\"height\":" + fmt(r.box.h, 1) +
                "}}";
        }
        regions += "]";

        const RedactionSettings& s = report.settings;
        return
            "{"
            "\"detections\":" + regions + ","
            "\"total_detections\":" + std::to_string(report.total) + ","
            "\"face_count\":" + std::to_string(report.face_count) + ","
            "\"plate_count\":" + std::to_string(report.plate_count) + ","
            "\"other_count\":" + std::to_string(report.other_count) + ","
            "\"processing_ms\":" + fmt(report.processing_ms, 2) + ","
            "\"blur_parameters\":{"
            "\"min_kernel_size\":" + std::to_string(s.min_kernel_size) + ","
            "\"max_kernel_size\":" + std::to_string(s.max_kernel_size) + ","
            "\"focus_exponent\":" + fmt(s.focus_exponent, 3) + ","
            "\"base_weight\":" + fmt(s.base_weight, 3) +
            "}}";
    }

    std::string stats_to_json(const FaceStatistics& stats) {
        return
            "{"
            "\"total_faces\":" + std::to_string(stats.total_faces) + ","
            "\"matched_faces\":" + std::to_string(stats.matched_faces) + ","
            "\"blurred_faces\":" + std::to_string(stats.blurred_faces) + ","
            "\"unmatchable_faces\":" + std::to_string(stats.unmatchable_faces) + ","
            "\"processing_ms\":" + fmt(stats.processing_ms, 2) +
            "}";
    }

    cv::Mat draw_detections(const cv::Mat& bgr,
                            const std::vector<Region>& regions,
                            bool draw_labels) {
        cv::Mat out = bgr.clone();
        if (out.empty()) return out;

        for (const auto& r : regions) {
            const cv::Rect rect = to_pixel_rect(r.box, out.cols, out.rows);
            if (rect.area() <= 0) continue;

            const cv::Scalar color = color_for(r.label);
            cv::rectangle(out, rect, color, 2);
            if (!draw_labels) continue;

            const std::string text = region_name(r) + ": " + fmt(r.confidence, 2);
            int baseline = 0;
            const cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.6, 1, &baseline);
            cv::rectangle(out,
                          cv::Point(rect.x, rect.y - ts.height - 10),
                          cv::Point(rect.x + ts.width, rect.y),
                          color,
                          cv::FILLED);
            cv::putText(out,
                        text,
                        cv::Point(rect.x, rect.y - 5),
                        cv::FONT_HERSHEY_SIMPLEX,
                        0.6,
                        cv::Scalar(255, 255, 255),
                        1);
        }
        return out;
    }
}
