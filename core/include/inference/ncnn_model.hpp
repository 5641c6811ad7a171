#pragma once

#include <memory>

#include <common/config.hpp>
#include <inference/detection_model.hpp>

namespace sr {
    // Converts a raw output matrix to candidate rows (cx, cy, w, h, conf,
    // class_id). Row-major input passes through. Feature-major input
    // (4 box rows plus one score row per class, one column per anchor) is
    // reduced to the best class per anchor.
    cv::Mat to_candidate_rows(const cv::Mat& raw);

    class NcnnModel final : public IDetectionModel {
    public:
        explicit NcnnModel(DetectorConfig cfg);
        ~NcnnModel() override;

        NcnnModel(NcnnModel&&) noexcept;
        NcnnModel& operator=(NcnnModel&&) noexcept;

        NcnnModel(const NcnnModel&) = delete;
        NcnnModel& operator=(const NcnnModel&) = delete;

        int input_width() const override;
        int input_height() const override;
        cv::Mat infer(const cv::Mat& letterboxed_bgr) const override;

    private:
        DetectorConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
