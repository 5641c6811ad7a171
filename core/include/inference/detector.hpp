#pragma once

#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <common/letterbox.hpp>
#include <inference/detection_model.hpp>
#include <pipeline/types.hpp>

namespace sr {
    float iou_of(const Box& a, const Box& b);

    // Filters raw network rows by confidence and maps them back into source
    // image space. Output keeps the network's row order.
    std::vector<Region> decode_candidates(const cv::Mat& raw,
                                          const LetterboxTransform& t,
                                          float confidence_threshold);

    // Class-agnostic greedy NMS. Equal confidences keep their input order.
    std::vector<Region> apply_nms(const std::vector<Region>& candidates,
                                  float iou_threshold,
                                  int top_k = 0);

    class Detector {
    public:
        explicit Detector(DetectorConfig cfg,
                          std::shared_ptr<const IDetectionModel> model = nullptr);

        void bind_model(std::shared_ptr<const IDetectionModel> model);
        bool has_model() const { return static_cast<bool>(model_); }

        // Throws RedactError: InvalidImage, ModelNotLoaded, InferenceFailure.
        std::vector<Region> detect(const cv::Mat& bgr) const;

    private:
        DetectorConfig cfg_;
        std::shared_ptr<const IDetectionModel> model_;
    };

    // True for a non-empty, 8-bit, 3-channel buffer.
    bool is_valid_image(const cv::Mat& bgr);
}
