#include <common/letterbox.hpp>

#include <cmath>
#include <iostream>
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

    bool near(float a, float b, float tol) {
        return std::fabs(a - b) <= tol;
    }

    void test_landscape_frame_is_padded_vertically() {
        const auto t = sr::make_letterbox(1280, 720, 640, 640);
        check(near(t.scale, 0.5f, 1e-6f), "1280x720 into 640 should scale by 0.5");
        check(t.resized_w == 640 && t.resized_h == 360, "resized frame should be 640x360");
        check(t.offset_x == 0, "no horizontal padding for a landscape frame");
        check(t.offset_y == 140, "vertical padding should be (640 - 360) / 2");
    }

    void test_offsets_use_floor_division() {
        const auto t = sr::make_letterbox(100, 33, 64, 64);
        // scale 0.64 -> 64 x 21, 43 rows of padding split 21 / 22
        check(t.resized_h == 21, "resized height should be floored");
        check(t.offset_y == 21, "odd padding should floor toward the top");
    }

    void test_missing_network_size_falls_back_to_default() {
        const auto t = sr::make_letterbox(320, 240, 0, -1);
        check(t.dst_w == sr::kDefaultNetworkSize && t.dst_h == sr::kDefaultNetworkSize,
              "unknown network size should fall back to 640x640");
        check(t.scale > 0.0f, "fallback transform should still have a positive scale");
    }

    void test_canvas_is_gray_padded_and_centered() {
        const cv::Mat white(720, 1280, CV_8UC3, cv::Scalar::all(255));
        sr::LetterboxTransform t;
        const cv::Mat net = sr::to_network_space(white, 640, 640, t);

        check(net.cols == 640 && net.rows == 640, "canvas should match the network size");
        check(net.at<cv::Vec3b>(0, 0)[0] == sr::kLetterboxFill, "padding should be mid-gray");
        check(net.at<cv::Vec3b>(639, 639)[2] == sr::kLetterboxFill, "bottom padding should be mid-gray");
        check(net.at<cv::Vec3b>(320, 320)[1] == 255, "image content should sit in the middle");
        check(net.at<cv::Vec3b>(140, 0)[0] == 255, "first content row should be at offset_y");
    }

    void test_round_trip_recovers_box_within_one_pixel() {
        struct Case {
            int w;
            int h;
            sr::Box box;
        };
        const std::vector<Case> cases = {
            {1280, 720, {100.0f, 50.0f, 300.0f, 200.0f}},
            {333, 777, {12.0f, 700.0f, 40.0f, 70.0f}},
            {50, 30, {0.0f, 0.0f, 50.0f, 30.0f}},
            {640, 640, {10.5f, 20.25f, 5.0f, 5.0f}},
            {4000, 3000, {3900.0f, 2900.0f, 100.0f, 100.0f}},
        };

        for (const auto& c : cases) {
            const auto t = sr::make_letterbox(c.w, c.h, 640, 640);
            const sr::Box back = sr::from_network_box(sr::to_network_box(c.box, t), t);
            const std::string tag = std::to_string(c.w) + "x" + std::to_string(c.h);
            check(near(back.x, c.box.x, 1.0f) && near(back.y, c.box.y, 1.0f) &&
                  near(back.w, c.box.w, 1.0f) && near(back.h, c.box.h, 1.0f),
                  "round trip should recover the box for " + tag);
        }
    }

    void test_inverse_mapping_clips_to_image() {
        const auto t = sr::make_letterbox(1280, 720, 640, 640);
        // Box hanging over the top padding and the right edge.
        const sr::Box net{600.0f, 100.0f, 100.0f, 100.0f};
        const sr::Box b = sr::from_network_box(net, t);

        check(b.y == 0.0f, "box above the content should clip to y = 0");
        check(near(b.h, 120.0f, 1e-3f), "clipped height should only cover content rows");
        check(near(b.x + b.w, 1280.0f, 1e-3f), "box should stop at the right image edge");
        check(b.w >= 0.0f && b.h >= 0.0f, "clipped sizes stay non-negative");
    }
}

int main() {
    test_landscape_frame_is_padded_vertically();
    test_offsets_use_floor_division();
    test_missing_network_size_falls_back_to_default();
    test_canvas_is_gray_padded_and_centered();
    test_round_trip_recovers_box_within_one_pixel();
    test_inverse_mapping_clips_to_image();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all letterbox tests passed\n";
    return 0;
}
