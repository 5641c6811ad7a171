#include <inference/face_finder.hpp>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace sr {
    HaarFaceFinder::HaarFaceFinder(MatcherConfig cfg)
        : cfg_(std::move(cfg)) {
        if (!std::filesystem::exists(cfg_.cascade_path)) {
            throw std::runtime_error("Haar cascade not found: " + cfg_.cascade_path +
                                     " (install opencv data or set matcher.cascade_path)");
        }
        if (!cascade_.load(cfg_.cascade_path) || cascade_.empty()) {
            throw std::runtime_error("Failed to load Haar cascade: " + cfg_.cascade_path);
        }
    }

    std::vector<cv::Rect> HaarFaceFinder::find(const cv::Mat& gray) const {
        std::vector<cv::Rect> faces;
        if (gray.empty()) return faces;

        cv::Mat g = gray;
        if (g.channels() == 3) cv::cvtColor(gray, g, cv::COLOR_BGR2GRAY);

        const cv::Size min_size(cfg_.min_face_size, cfg_.min_face_size);
        std::lock_guard<std::mutex> lk(mu_);
        cascade_.detectMultiScale(g,
                                  faces,
                                  cfg_.scale_factor,
                                  cfg_.min_neighbors,
                                  cv::CASCADE_SCALE_IMAGE,
                                  min_size);
        return faces;
    }
}
