#pragma once

#include <string>

namespace sr {
    struct DetectorConfig {
        std::string param_path = "models/detector/sensitive_yolov8n.ncnn.param";
        std::string bin_path = "models/detector/sensitive_yolov8n.ncnn.bin";
        std::string input_blob = "in0";
        std::string output_blob = "out0";
        int input_w = 640;
        int input_h = 640;
        float confidence_threshold = 0.2f;
        float iou_threshold = 0.5f;
        int top_k = 0; // 0 = unlimited
        int ncnn_threads = 1;
    };

    struct RedactionSettings {
        int min_kernel_size = 9;
        int max_kernel_size = 45;
        float focus_exponent = 2.5f;
        float base_weight = 0.35f;

        // Odd kernels >= 3 with min <= max, focus > 0, base weight in [0, 1].
        // Malformed values are repaired rather than rejected.
        RedactionSettings normalized() const;
    };

    struct MatcherConfig {
        float tolerance = 0.75f;
        int blur_kernel = 51;
        std::string cascade_path = "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml";
        double scale_factor = 1.1;
        int min_neighbors = 5;
        int min_face_size = 60;
    };

    struct BlurTargets {
        bool faces = true;
        bool plates = true;
    };

    struct AppConfig {
        DetectorConfig detector;
        RedactionSettings redaction;
        BlurTargets targets;
        MatcherConfig matcher;
    };

    // Forces an odd kernel >= 3.
    int odd_kernel(int k);

    // Command-line overrides. Both throw std::invalid_argument on malformed or
    // out-of-range text; the kernel comes back forced odd.
    float parse_tolerance(const std::string& text);
    int parse_kernel_size(const std::string& text);

    AppConfig load_config_yaml(const std::string& path);
}
