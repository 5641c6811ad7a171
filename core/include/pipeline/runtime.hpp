#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <inference/detector.hpp>
#include <inference/face_finder.hpp>
#include <matching/reference_matcher.hpp>

#include <pipeline/types.hpp>

namespace sr {
    enum class PipelineState {
        Idle,
        Detecting,
        Matching,
        Redacting,
        Done,
        Failed
    };

    const char* state_name(PipelineState s);

    using StateObserver = std::function<void(PipelineState)>;

    struct BlanketResult {
        cv::Mat image;
        DetectionReport report;
    };

    struct SelectiveResult {
        cv::Mat image;
        FaceStatistics stats;
    };

    // Sequences detection and redaction for one image per call. Holds only the
    // injected collaborators, so one instance can serve concurrent callers.
    class PipelineRuntime {
    public:
        PipelineRuntime(std::shared_ptr<const Detector> detector,
                        std::shared_ptr<const IFaceFinder> face_finder);

        // Detect with the network, then adaptively blur enabled labels.
        BlanketResult run_blanket(const cv::Mat& bgr,
                                  const LabelSet& enabled,
                                  const RedactionSettings& settings,
                                  const StateObserver& observer = {}) const;

        // Find faces classically, keep those matching the reference, blur the
        // rest with a fixed kernel.
        SelectiveResult run_selective(const cv::Mat& bgr,
                                      const Embedding& reference,
                                      float tolerance,
                                      int blur_kernel,
                                      const StateObserver& observer = {}) const;

    private:
        std::vector<Region> run_inference_(const cv::Mat& bgr) const;
        std::vector<cv::Rect> find_faces_(const cv::Mat& gray) const;

        std::shared_ptr<const Detector> detector_;
        std::shared_ptr<const IFaceFinder> face_finder_;
    };
}
