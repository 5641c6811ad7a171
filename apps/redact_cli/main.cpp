#include <common/config.hpp>
#include <common/errors.hpp>
#include <inference/detector.hpp>
#include <inference/face_finder.hpp>
#include <inference/ncnn_model.hpp>
#include <matching/embedding_io.hpp>
#include <matching/reference_matcher.hpp>
#include <pipeline/report.hpp>
#include <pipeline/runtime.hpp>

#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/exceptions.h>

#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    constexpr int kExitUsage = 1;
    constexpr int kExitBadInput = 2;
    constexpr int kExitFailure = 3;

    void print_usage(const char* argv0) {
        std::cerr
            << "usage:\n"
            << "  " << argv0 << " <config.yaml> detect <in> <out> [--no-faces] [--no-plates] [--debug <annotated>]\n"
            << "  " << argv0 << " <config.yaml> reference <ref_image> <embedding.bin>\n"
            << "  " << argv0 << " <config.yaml> selective <embedding.bin> <in> <out> [--tolerance t] [--kernel k]\n";
    }

    cv::Mat read_image_or_throw(const std::string& path) {
        cv::Mat img = cv::imread(path, cv::IMREAD_COLOR);
        if (img.empty()) {
            throw sr::RedactError(sr::ErrorCode::InvalidImage,
                                  "Failed to load image at '" + path +
                                  "'. Ensure the path is correct and the file is a valid image.");
        }
        return img;
    }

    void write_image_or_throw(const std::string& path, const cv::Mat& img) {
        if (!cv::imwrite(path, img)) {
            throw std::runtime_error("Failed to write image to '" + path + "'");
        }
    }

    int run_detect(const sr::AppConfig& cfg, const std::vector<std::string>& args) {
        if (args.size() < 2) return kExitUsage;
        const std::string& in_path = args[0];
        const std::string& out_path = args[1];

        sr::BlurTargets targets = cfg.targets;
        std::string debug_path;
        for (size_t i = 2; i < args.size(); ++i) {
            if (args[i] == "--no-faces") targets.faces = false;
            else if (args[i] == "--no-plates") targets.plates = false;
            else if (args[i] == "--debug" && i + 1 < args.size()) debug_path = args[++i];
            else {
                std::cerr << "Unknown option: " << args[i] << "\n";
                return kExitUsage;
            }
        }

        auto model = std::make_shared<const sr::NcnnModel>(cfg.detector);
        auto detector = std::make_shared<const sr::Detector>(cfg.detector, model);
        sr::PipelineRuntime pipeline(detector, nullptr);

        const cv::Mat image = read_image_or_throw(in_path);
        const sr::BlanketResult result =
            pipeline.run_blanket(image, sr::labels_from_targets(targets), cfg.redaction);

        write_image_or_throw(out_path, result.image);
        if (!debug_path.empty()) {
            write_image_or_throw(debug_path, sr::draw_detections(image, result.report.regions, true));
        }

        std::cerr << "[redact_cli] processed " << in_path << ": " << result.report.total
                  << " detections in " << result.report.processing_ms << " ms\n";
        std::cout << sr::report_to_json(result.report) << "\n";
        return 0;
    }

    int run_reference(const sr::AppConfig& cfg, const std::vector<std::string>& args) {
        if (args.size() != 2) return kExitUsage;

        const sr::HaarFaceFinder finder(cfg.matcher);
        const sr::Embedding e = sr::load_reference(read_image_or_throw(args[0]), finder);
        sr::save_embedding(args[1], e);

        std::cerr << "[redact_cli] stored reference embedding from " << args[0]
                  << " to " << args[1] << "\n";
        std::cout << "{\"encoding_length\":" << e.size() << "}\n";
        return 0;
    }

    int run_selective(const sr::AppConfig& cfg, const std::vector<std::string>& args) {
        if (args.size() < 3) return kExitUsage;

        float tolerance = cfg.matcher.tolerance;
        int kernel = cfg.matcher.blur_kernel;
        try {
            for (size_t i = 3; i < args.size(); ++i) {
                if (args[i] == "--tolerance" && i + 1 < args.size()) tolerance = sr::parse_tolerance(args[++i]);
                else if (args[i] == "--kernel" && i + 1 < args.size()) kernel = sr::parse_kernel_size(args[++i]);
                else {
                    std::cerr << "Unknown option: " << args[i] << "\n";
                    return kExitUsage;
                }
            }
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return kExitUsage;
        }

        const sr::Embedding reference = sr::load_embedding(args[0]);
        auto finder = std::make_shared<const sr::HaarFaceFinder>(cfg.matcher);
        sr::PipelineRuntime pipeline(nullptr, finder);

        const sr::SelectiveResult result =
            pipeline.run_selective(read_image_or_throw(args[1]), reference, tolerance, kernel);
        write_image_or_throw(args[2], result.image);

        std::cerr << "[redact_cli] selectively blurred " << args[1] << ": "
                  << result.stats.blurred_faces << "/" << result.stats.total_faces << " faces\n";
        std::cout << sr::stats_to_json(result.stats) << "\n";
        return 0;
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const std::string cfg_path = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    sr::AppConfig cfg;
    try {
        cfg = sr::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    int rc = kExitUsage;
    try {
        if (command == "detect") rc = run_detect(cfg, args);
        else if (command == "reference") rc = run_reference(cfg, args);
        else if (command == "selective") rc = run_selective(cfg, args);
    } catch (const sr::RedactError& e) {
        std::cerr << e.what() << "\n";
        return e.is_bad_input() ? kExitBadInput : kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Processing failed: " << e.what() << "\n";
        return kExitFailure;
    }

    if (rc == kExitUsage) print_usage(argv[0]);
    return rc;
}
