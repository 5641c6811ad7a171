#include <inference/detector.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

#include <common/errors.hpp>

namespace sr {
    namespace {
        float area_of(const Box& b) {
            return std::max(0.0f, b.w) * std::max(0.0f, b.h);
        }

        // Anything that does not fit an int maps to -1 (Unknown).
        int class_id_of(float v) {
            if (!std::isfinite(v)) return -1;
            if (v < static_cast<float>(std::numeric_limits<int>::min()) ||
                v >= static_cast<float>(std::numeric_limits<int>::max())) {
                return -1;
            }
            return static_cast<int>(v);
        }
    } // namespace

    float iou_of(const Box& a, const Box& b) {
        const float ax2 = a.x + a.w;
        const float ay2 = a.y + a.h;
        const float bx2 = b.x + b.w;
        const float by2 = b.y + b.h;

        const float xx1 = std::max(a.x, b.x);
        const float yy1 = std::max(a.y, b.y);
        const float xx2 = std::min(ax2, bx2);
        const float yy2 = std::min(ay2, by2);

        const float iw = std::max(0.0f, xx2 - xx1);
        const float ih = std::max(0.0f, yy2 - yy1);
        const float inter = iw * ih;
        if (inter <= 0.0f) return 0.0f;

        const float uni = area_of(a) + area_of(b) - inter;
        if (uni <= 0.0f) return 0.0f;
        return inter / uni;
    }

    std::vector<Region> decode_candidates(const cv::Mat& raw,
                                          const LetterboxTransform& t,
                                          float confidence_threshold) {
        std::vector<Region> out;
        if (raw.empty() || raw.cols < 6) return out;

        cv::Mat rows = raw;
        if (rows.type() != CV_32F) raw.convertTo(rows, CV_32F);
        out.reserve(static_cast<size_t>(rows.rows));

        for (int r = 0; r < rows.rows; ++r) {
            const float* p = rows.ptr<float>(r);
            const float conf = p[4];
            if (!std::isfinite(conf) || conf < confidence_threshold) continue;

            const float cx = p[0];
            const float cy = p[1];
            const float w = p[2];
            const float h = p[3];
            if (!std::isfinite(cx) || !std::isfinite(cy) ||
                !std::isfinite(w) || !std::isfinite(h)) {
                continue;
            }

            Box net;
            net.x = cx - w * 0.5f;
            net.y = cy - h * 0.5f;
            net.w = w;
            net.h = h;

            Region region;
            region.box = from_network_box(net, t);
            if (region.box.w <= 0.0f || region.box.h <= 0.0f) continue;

            region.class_id = class_id_of(p[5]);
            region.label = label_from_class_id(region.class_id);
            region.confidence = std::min(1.0f, std::max(0.0f, conf));
            out.push_back(region);
        }
        return out;
    }

    std::vector<Region> apply_nms(const std::vector<Region>& candidates,
                                  float iou_threshold,
                                  int top_k) {
        std::vector<int> order(candidates.size());
        std::iota(order.begin(), order.end(), 0);

        std::stable_sort(order.begin(),
                         order.end(),
                         [&candidates](int a, int b) {
                             return candidates[static_cast<size_t>(a)].confidence >
                                    candidates[static_cast<size_t>(b)].confidence;
                         });

        if (top_k > 0 && static_cast<int>(order.size()) > top_k) {
            order.resize(static_cast<size_t>(top_k));
        }

        std::vector<int> keep_indices;
        keep_indices.reserve(order.size());

        for (int idx : order) {
            const Region& cand = candidates[static_cast<size_t>(idx)];
            bool keep = true;
            for (int kept : keep_indices) {
                if (iou_of(cand.box, candidates[static_cast<size_t>(kept)].box) >= iou_threshold) {
                    keep = false;
                    break;
                }
            }
            if (keep) keep_indices.push_back(idx);
        }

        std::vector<Region> out;
        out.reserve(keep_indices.size());
        for (int idx : keep_indices) {
            out.push_back(candidates[static_cast<size_t>(idx)]);
        }
        return out;
    }

    bool is_valid_image(const cv::Mat& bgr) {
        return !bgr.empty() && bgr.rows >= 1 && bgr.cols >= 1 && bgr.type() == CV_8UC3;
    }

    Detector::Detector(DetectorConfig cfg, std::shared_ptr<const IDetectionModel> model)
        : cfg_(std::move(cfg)),
          model_(std::move(model)) {}

    void Detector::bind_model(std::shared_ptr<const IDetectionModel> model) {
        model_ = std::move(model);
    }

    std::vector<Region> Detector::detect(const cv::Mat& bgr) const {
        if (!is_valid_image(bgr)) {
            throw RedactError(ErrorCode::InvalidImage,
                              "expected a non-empty 8-bit 3-channel image");
        }
        if (!model_) {
            throw RedactError(ErrorCode::ModelNotLoaded, "detector has no model bound");
        }

        LetterboxTransform t;
        const cv::Mat net_in = to_network_space(bgr, model_->input_width(), model_->input_height(), t);

        cv::Mat raw;
        try {
            raw = model_->infer(net_in);
        } catch (const std::exception& e) {
            throw RedactError(ErrorCode::InferenceFailure, e.what());
        }
        if (!raw.empty() && raw.cols < 6) {
            throw RedactError(ErrorCode::InferenceFailure,
                              "model output has " + std::to_string(raw.cols) +
                              " columns, expected at least 6");
        }

        const std::vector<Region> candidates =
            decode_candidates(raw, t, cfg_.confidence_threshold);
        return apply_nms(candidates, cfg_.iou_threshold, cfg_.top_k);
    }
}
