#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>

#include <common/config.hpp>

namespace sr {
    // Classical face localisation used by selective redaction.
    class IFaceFinder {
    public:
        virtual ~IFaceFinder() = default;
        virtual std::vector<cv::Rect> find(const cv::Mat& gray) const = 0;
    };

    class HaarFaceFinder final : public IFaceFinder {
    public:
        explicit HaarFaceFinder(MatcherConfig cfg);

        std::vector<cv::Rect> find(const cv::Mat& gray) const override;

    private:
        MatcherConfig cfg_;
        // detectMultiScale reuses buffers inside the classifier.
        mutable std::mutex mu_;
        mutable cv::CascadeClassifier cascade_;
    };
}
