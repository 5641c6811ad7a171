#include <common/errors.hpp>
#include <inference/detector.hpp>
#include <inference/ncnn_model.hpp>

#include "fakes.hpp"

#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool near(float a, float b, float tol = 1e-3f) {
        return std::fabs(a - b) <= tol;
    }

    sr::Region region(float x, float y, float w, float h, float conf, sr::Label label = sr::Label::Face) {
        sr::Region r;
        r.label = label;
        r.class_id = label == sr::Label::LicensePlate ? 1 : 0;
        r.confidence = conf;
        r.box = {x, y, w, h};
        return r;
    }

    bool throws_code(const std::function<void()>& fn, sr::ErrorCode code) {
        try {
            fn();
        } catch (const sr::RedactError& e) {
            return e.code() == code;
        }
        return false;
    }

    sr::Detector make_detector(const cv::Mat& rows, float conf = 0.2f, float iou = 0.5f) {
        sr::DetectorConfig cfg;
        cfg.confidence_threshold = conf;
        cfg.iou_threshold = iou;
        return sr::Detector(cfg, std::make_shared<const sr_test::FakeModel>(640, 640, rows));
    }

    void test_decode_maps_center_form_back_to_image() {
        const cv::Mat frame(720, 1280, CV_8UC3, cv::Scalar::all(40));
        const auto det = make_detector(sr_test::make_rows({{320, 320, 100, 50, 0.9f, 0}}));
        const auto regions = det.detect(frame);

        check(regions.size() == 1, "one confident row should produce one region");
        if (regions.size() != 1) return;
        const auto& b = regions[0].box;
        check(near(b.x, 540.0f) && near(b.y, 310.0f), "corner should be remapped through the letterbox");
        check(near(b.w, 200.0f) && near(b.h, 100.0f), "size should be divided by the scale");
        check(regions[0].label == sr::Label::Face, "class 0 should be a face");
        check(near(regions[0].confidence, 0.9f), "confidence should pass through");
    }

    void test_threshold_is_inclusive() {
        const sr::LetterboxTransform t = sr::make_letterbox(640, 640, 640, 640);
        const auto regions = sr::decode_candidates(
            sr_test::make_rows({
                {100, 100, 20, 20, 0.1f, 0},
                {300, 300, 20, 20, 0.2f, 1},
            }),
            t,
            0.2f);

        check(regions.size() == 1, "rows below the threshold should be dropped");
        check(!regions.empty() && regions[0].label == sr::Label::LicensePlate,
              "a row exactly at the threshold should be kept");
    }

    void test_unknown_class_id_is_kept_with_fallback_name() {
        const sr::LetterboxTransform t = sr::make_letterbox(640, 640, 640, 640);
        const auto regions = sr::decode_candidates(
            sr_test::make_rows({{100, 100, 20, 20, 0.8f, 7}}), t, 0.2f);

        check(regions.size() == 1, "unrecognized class ids are not an error");
        if (regions.empty()) return;
        check(regions[0].label == sr::Label::Unknown, "class 7 should map to Unknown");
        check(sr::region_name(regions[0]) == "class_7", "unknown classes should be named class_{id}");
    }

    void test_out_of_range_class_id_maps_to_unknown() {
        const sr::LetterboxTransform t = sr::make_letterbox(640, 640, 640, 640);
        const auto regions = sr::decode_candidates(
            sr_test::make_rows({
                {100, 100, 20, 20, 0.8f, 1e20f},
                {300, 300, 20, 20, 0.8f, -1e20f},
            }),
            t,
            0.2f);

        check(regions.size() == 2, "huge class ids should not drop the candidate");
        for (const auto& r : regions) {
            check(r.class_id == -1 && r.label == sr::Label::Unknown,
                  "class ids outside the int range should become Unknown");
        }
    }

    // 4 box rows + 2 score rows (face, plate), one column per anchor.
    cv::Mat feature_major_head() {
        cv::Mat m(6, 8, CV_32F, cv::Scalar::all(0.0f));
        const float plate[6] = {320, 320, 50, 20, 0.05f, 0.92f};
        const float face[6] = {100, 100, 40, 40, 0.80f, 0.10f};
        for (int f = 0; f < 6; ++f) {
            m.at<float>(f, 2) = plate[f];
            m.at<float>(f, 5) = face[f];
        }
        return m;
    }

    void test_feature_major_output_takes_best_class() {
        const cv::Mat rows = sr::to_candidate_rows(feature_major_head());

        check(rows.rows == 8 && rows.cols == 6, "one candidate row per anchor column");
        if (rows.rows != 8 || rows.cols != 6) return;
        check(near(rows.at<float>(2, 4), 0.92f) && near(rows.at<float>(2, 5), 1.0f),
              "plate-dominant anchor should carry the plate score and class 1");
        check(near(rows.at<float>(5, 4), 0.80f) && near(rows.at<float>(5, 5), 0.0f),
              "face-dominant anchor should carry the face score and class 0");
        check(near(rows.at<float>(2, 0), 320.0f) && near(rows.at<float>(2, 3), 20.0f),
              "box features should be copied unchanged");

        const sr::LetterboxTransform t = sr::make_letterbox(640, 640, 640, 640);
        const auto regions = sr::decode_candidates(rows, t, 0.2f);
        check(regions.size() == 2, "only the two scored anchors pass the threshold");
        bool plate_seen = false;
        for (const auto& r : regions) {
            if (r.label == sr::Label::LicensePlate && near(r.confidence, 0.92f)) plate_seen = true;
        }
        check(plate_seen, "a confident plate must survive decoding as a plate");
    }

    void test_single_class_head_and_row_major_passthrough() {
        cv::Mat single(5, 10, CV_32F, cv::Scalar::all(0.0f));
        single.at<float>(4, 3) = 0.7f;
        const cv::Mat from_single = sr::to_candidate_rows(single);
        check(from_single.rows == 10 && from_single.cols == 6, "single-class head should expand to 6 columns");
        check(from_single.rows == 10 && near(from_single.at<float>(3, 4), 0.7f) &&
                  near(from_single.at<float>(3, 5), 0.0f),
              "single-class head should use class 0");

        const cv::Mat row_major = sr_test::make_rows({
            {10, 10, 5, 5, 0.5f, 1},
            {20, 20, 5, 5, 0.6f, 0},
            {30, 30, 5, 5, 0.7f, 0},
            {40, 40, 5, 5, 0.8f, 1},
            {50, 50, 5, 5, 0.9f, 0},
        });
        const cv::Mat passed = sr::to_candidate_rows(row_major);
        check(passed.rows == 5 && passed.cols == 6 &&
                  cv::norm(passed, row_major, cv::NORM_INF) == 0.0,
              "row-major output should pass through unchanged");
        check(sr::to_candidate_rows(cv::Mat()).empty(), "empty output stays empty");
    }

    void test_decode_clips_and_drops_boxes_outside_image() {
        const sr::LetterboxTransform t = sr::make_letterbox(1280, 720, 640, 640);
        const auto regions = sr::decode_candidates(
            sr_test::make_rows({
                {10, 10, 20, 20, 0.9f, 0},  // entirely in the top padding
                {630, 320, 40, 40, 0.9f, 0}, // straddles the right edge
            }),
            t,
            0.2f);

        check(regions.size() == 1, "a box that only covers padding should be dropped");
        if (regions.empty()) return;
        check(near(regions[0].box.x + regions[0].box.w, 1280.0f), "box should be clipped to the image width");
    }

    void test_nms_suppresses_overlapping_lower_confidence() {
        const std::vector<sr::Region> in = {
            region(10, 10, 100, 100, 0.4f),
            region(0, 0, 100, 100, 0.9f),
        };
        const auto out = sr::apply_nms(in, 0.5f);

        check(out.size() == 1, "IoU 0.68 >= 0.5 should suppress the weaker box");
        check(!out.empty() && near(out[0].confidence, 0.9f), "the 0.9 box should survive");
    }

    void test_nms_keeps_boxes_below_threshold() {
        const std::vector<sr::Region> in = {
            region(0, 0, 100, 100, 0.4f),
            region(60, 0, 100, 100, 0.9f),
        };
        const auto out = sr::apply_nms(in, 0.5f);

        check(out.size() == 2, "IoU 0.25 < 0.5 should keep both boxes");
        check(out.size() == 2 && out[0].confidence > out[1].confidence,
              "survivors should be ordered by confidence");
    }

    void test_nms_ties_prefer_earlier_candidate() {
        const std::vector<sr::Region> in = {
            region(0, 0, 100, 100, 0.7f, sr::Label::LicensePlate),
            region(5, 5, 100, 100, 0.7f, sr::Label::Face),
        };
        const auto out = sr::apply_nms(in, 0.5f);

        check(out.size() == 1, "equal-confidence duplicates should collapse to one");
        check(!out.empty() && out[0].label == sr::Label::LicensePlate,
              "the earlier decoded candidate should win a tie");
    }

    void test_nms_is_class_agnostic() {
        const std::vector<sr::Region> in = {
            region(0, 0, 100, 100, 0.9f, sr::Label::Face),
            region(0, 0, 100, 95, 0.8f, sr::Label::LicensePlate),
        };
        const auto out = sr::apply_nms(in, 0.5f);
        check(out.size() == 1 && out[0].label == sr::Label::Face,
              "a plate overlapping a stronger face should be suppressed");
    }

    void test_nms_top_k_caps_candidates() {
        const std::vector<sr::Region> in = {
            region(0, 0, 10, 10, 0.5f),
            region(100, 0, 10, 10, 0.9f),
            region(200, 0, 10, 10, 0.7f),
        };
        const auto out = sr::apply_nms(in, 0.5f, 2);
        check(out.size() == 2, "top_k should cap the candidate list");
        check(out.size() == 2 && near(out[1].confidence, 0.7f), "top_k should keep the strongest");
    }

    void test_detect_runs_nms_on_decoded_rows() {
        const cv::Mat frame(640, 640, CV_8UC3, cv::Scalar::all(0));
        const auto det = make_detector(sr_test::make_rows({
            {100, 100, 50, 50, 0.6f, 0},
            {102, 101, 50, 50, 0.95f, 0},
            {400, 400, 80, 40, 0.5f, 1},
        }));
        const auto regions = det.detect(frame);

        check(regions.size() == 2, "duplicate face rows should collapse");
        check(regions.size() == 2 && near(regions[0].confidence, 0.95f),
              "strongest face should come first");
        check(regions.size() == 2 && regions[1].label == sr::Label::LicensePlate,
              "the plate should survive");
    }

    void test_detect_error_taxonomy() {
        const cv::Mat frame(64, 64, CV_8UC3, cv::Scalar::all(0));

        const sr::Detector unbound(sr::DetectorConfig{});
        check(throws_code([&] { (void)unbound.detect(frame); }, sr::ErrorCode::ModelNotLoaded),
              "detect without a model should raise ModelNotLoaded");

        const auto det = make_detector(sr_test::make_rows({}));
        check(throws_code([&] { (void)det.detect(cv::Mat()); }, sr::ErrorCode::InvalidImage),
              "empty image should raise InvalidImage");
        check(throws_code([&] { (void)det.detect(cv::Mat(10, 10, CV_8UC1)); }, sr::ErrorCode::InvalidImage),
              "single channel image should raise InvalidImage");

        const sr::Detector failing(sr::DetectorConfig{}, std::make_shared<const sr_test::ThrowingModel>());
        check(throws_code([&] { (void)failing.detect(frame); }, sr::ErrorCode::InferenceFailure),
              "backend exceptions should surface as InferenceFailure");

        const sr::Detector narrow(sr::DetectorConfig{},
                                  std::make_shared<const sr_test::FakeModel>(640, 640, cv::Mat(3, 4, CV_32F, cv::Scalar(0))));
        check(throws_code([&] { (void)narrow.detect(frame); }, sr::ErrorCode::InferenceFailure),
              "outputs with fewer than 6 columns should be an InferenceFailure");

        try {
            (void)unbound.detect(frame);
        } catch (const sr::RedactError& e) {
            check(!e.is_bad_input(), "ModelNotLoaded is a processing failure");
        }
    }

    void test_bind_model_after_construction() {
        sr::Detector det(sr::DetectorConfig{});
        check(!det.has_model(), "detector should start unbound");
        det.bind_model(std::make_shared<const sr_test::FakeModel>(640, 640, sr_test::make_rows({})));
        check(det.has_model(), "bind_model should attach the model");
        check(det.detect(cv::Mat(32, 32, CV_8UC3, cv::Scalar::all(1))).empty(),
              "no rows should produce no regions");
    }
}

int main() {
    test_decode_maps_center_form_back_to_image();
    test_threshold_is_inclusive();
    test_unknown_class_id_is_kept_with_fallback_name();
    test_out_of_range_class_id_maps_to_unknown();
    test_feature_major_output_takes_best_class();
    test_single_class_head_and_row_major_passthrough();
    test_decode_clips_and_drops_boxes_outside_image();
    test_nms_suppresses_overlapping_lower_confidence();
    test_nms_keeps_boxes_below_threshold();
    test_nms_ties_prefer_earlier_candidate();
    test_nms_is_class_agnostic();
    test_nms_top_k_caps_candidates();
    test_detect_runs_nms_on_decoded_rows();
    test_detect_error_taxonomy();
    test_bind_model_after_construction();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all detector tests passed\n";
    return 0;
}
