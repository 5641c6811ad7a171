#include <pipeline/runtime.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

#include <opencv2/imgproc.hpp>

#include <anonymization/anonymizer.hpp>
#include <common/errors.hpp>

namespace sr {
    namespace {
        using Clock = std::chrono::steady_clock;

        double elapsed_ms(Clock::time_point since) {
            return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
        }

        void notify(const StateObserver& observer, PipelineState s) {
            if (observer) observer(s);
        }

        void count_labels(DetectionReport& report) {
            report.total = static_cast<int>(report.regions.size());
            for (const auto& r : report.regions) {
                switch (r.label) {
                    case Label::Face: ++report.face_count; break;
                    case Label::LicensePlate: ++report.plate_count; break;
                    case Label::Unknown: ++report.other_count; break;
                }
            }
        }
    } // namespace

    const char* state_name(PipelineState s) {
        switch (s) {
            case PipelineState::Idle: return "idle";
            case PipelineState::Detecting: return "detecting";
            case PipelineState::Matching: return "matching";
            case PipelineState::Redacting: return "redacting";
            case PipelineState::Done: return "done";
            case PipelineState::Failed: return "failed";
        }
        return "unknown";
    }

    PipelineRuntime::PipelineRuntime(std::shared_ptr<const Detector> detector,
                                     std::shared_ptr<const IFaceFinder> face_finder)
        : detector_(std::move(detector)),
          face_finder_(std::move(face_finder)) {}

    BlanketResult PipelineRuntime::run_blanket(const cv::Mat& bgr,
                                               const LabelSet& enabled,
                                               const RedactionSettings& settings,
                                               const StateObserver& observer) const {
        const auto start = Clock::now();
        PipelineState stage = PipelineState::Idle;
        const auto enter = [&observer, &stage](PipelineState next) {
            stage = next;
            notify(observer, next);
        };
        enter(PipelineState::Idle);

        try {
            if (!is_valid_image(bgr)) {
                throw RedactError(ErrorCode::InvalidImage,
                                  "expected a non-empty 8-bit 3-channel image");
            }

            BlanketResult result;
            result.report.settings = settings.normalized();

            enter(PipelineState::Detecting);
            result.report.regions = run_inference_(bgr);
            count_labels(result.report);

            enter(PipelineState::Redacting);
            if (enabled.empty()) {
                result.image = bgr.clone();
            } else {
                result.image = redact_adaptive(bgr, result.report.regions, enabled, result.report.settings);
            }

            result.report.processing_ms = elapsed_ms(start);
            enter(PipelineState::Done);
            return result;
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline](run_blanket) failed while " << state_name(stage) << ": " << e.what() << "\n";
            notify(observer, PipelineState::Failed);
            throw;
        }
    }

    SelectiveResult PipelineRuntime::run_selective(const cv::Mat& bgr,
                                                   const Embedding& reference,
                                                   float tolerance,
                                                   int blur_kernel,
                                                   const StateObserver& observer) const {
        const auto start = Clock::now();
        PipelineState stage = PipelineState::Idle;
        const auto enter = [&observer, &stage](PipelineState next) {
            stage = next;
            notify(observer, next);
        };
        enter(PipelineState::Idle);

        try {
            if (!is_valid_image(bgr)) {
                throw RedactError(ErrorCode::InvalidImage,
                                  "expected a non-empty 8-bit 3-channel image");
            }
            if (reference.empty()) {
                throw RedactError(ErrorCode::InvalidEmbedding,
                                  "reference embedding missing; load a reference face first");
            }

            cv::Mat gray;
            cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

            enter(PipelineState::Detecting);
            const std::vector<cv::Rect> faces = find_faces_(gray);
            if (faces.empty()) {
                std::cerr << "[Pipeline](run_selective) no faces detected.\n";
            }

            SelectiveResult result;
            result.stats.total_faces = static_cast<int>(faces.size());

            enter(PipelineState::Matching);
            const cv::Rect bounds(0, 0, gray.cols, gray.rows);
            std::vector<cv::Rect> to_blur;
            to_blur.reserve(faces.size());

            for (const auto& face : faces) {
                const cv::Rect roi = face & bounds;
                if (roi.area() <= 0) {
                    std::cerr << "[Pipeline](run_selective) skipping empty face region at ("
                              << face.x << ", " << face.y << ", " << face.width << ", "
                              << face.height << ")\n";
                    continue;
                }
                try {
                    const Embedding candidate = embed(gray(roi));
                    if (is_match(candidate, reference, tolerance)) {
                        ++result.stats.matched_faces;
                        continue;
                    }
                } catch (const RedactError& e) {
                    if (e.code() != ErrorCode::DegenerateCrop) throw;
                    std::cerr << "[Pipeline](run_selective) blurring unmatchable face at ("
                              << face.x << ", " << face.y << ", " << face.width << ", "
                              << face.height << "): " << e.what() << "\n";
                    ++result.stats.unmatchable_faces;
                }
                to_blur.push_back(roi);
            }
            result.stats.blurred_faces = static_cast<int>(to_blur.size());

            enter(PipelineState::Redacting);
            result.image = blur_fixed(bgr, to_blur, blur_kernel);

            result.stats.processing_ms = elapsed_ms(start);
            enter(PipelineState::Done);
            return result;
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline](run_selective) failed while " << state_name(stage) << ": " << e.what() << "\n";
            notify(observer, PipelineState::Failed);
            throw;
        }
    }

    // hooks

    std::vector<Region> PipelineRuntime::run_inference_(const cv::Mat& bgr) const {
        if (!detector_) {
            throw RedactError(ErrorCode::ModelNotLoaded, "pipeline has no detector");
        }
        return detector_->detect(bgr);
    }

    std::vector<cv::Rect> PipelineRuntime::find_faces_(const cv::Mat& gray) const {
        if (!face_finder_) {
            throw RedactError(ErrorCode::ModelNotLoaded, "pipeline has no face finder");
        }
        return face_finder_->find(gray);
    }
}
