#include <matching/reference_matcher.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

#include <opencv2/imgproc.hpp>

#include <common/errors.hpp>
#include <inference/detector.hpp>

namespace sr {
    namespace {
        constexpr double kUnitNormTolerance = 1e-3;

        double l2_norm(const std::vector<float>& v) {
            double acc = 0.0;
            for (float x : v) acc += static_cast<double>(x) * static_cast<double>(x);
            return std::sqrt(acc);
        }
    } // namespace

    Embedding Embedding::from_unit_vector(std::vector<float> values) {
        if (values.empty()) {
            throw RedactError(ErrorCode::InvalidEmbedding, "embedding has no values");
        }
        const double norm = l2_norm(values);
        if (!std::isfinite(norm) || std::abs(norm - 1.0) > kUnitNormTolerance) {
            throw RedactError(ErrorCode::InvalidEmbedding,
                              "embedding is not unit length (norm " + std::to_string(norm) + ")");
        }
        return Embedding(std::move(values));
    }

    Embedding embed(const cv::Mat& face_crop) {
        if (face_crop.empty() || face_crop.rows <= 0 || face_crop.cols <= 0) {
            throw RedactError(ErrorCode::EmptyCrop, "cannot compute embedding for an empty face crop");
        }

        cv::Mat gray;
        if (face_crop.channels() == 3) {
            cv::cvtColor(face_crop, gray, cv::COLOR_BGR2GRAY);
        } else {
            gray = face_crop;
        }
        if (gray.depth() != CV_8U) gray.convertTo(gray, CV_8U);

        cv::Mat resized;
        cv::resize(gray, resized, cv::Size(kEmbeddingSide, kEmbeddingSide), 0, 0, cv::INTER_LINEAR);
        cv::Mat equalized;
        cv::equalizeHist(resized, equalized);

        std::vector<float> v;
        v.reserve(kEmbeddingSize);
        double sum = 0.0;
        for (int y = 0; y < equalized.rows; ++y) {
            const uchar* row = equalized.ptr<uchar>(y);
            for (int x = 0; x < equalized.cols; ++x) {
                v.push_back(static_cast<float>(row[x]));
                sum += row[x];
            }
        }

        const float mean = static_cast<float>(sum / static_cast<double>(v.size()));
        for (float& x : v) x -= mean;

        const double norm = l2_norm(v);
        if (norm == 0.0) {
            throw RedactError(ErrorCode::DegenerateCrop,
                              "face crop has zero variance; cannot compute embedding");
        }
        const float inv = static_cast<float>(1.0 / norm);
        for (float& x : v) x *= inv;
        return Embedding(std::move(v));
    }

    float similarity(const Embedding& a, const Embedding& b) {
        if (a.size() != b.size() || a.empty()) {
            throw RedactError(ErrorCode::InvalidEmbedding,
                              "embedding length mismatch: " + std::to_string(a.size()) +
                              " vs " + std::to_string(b.size()));
        }
        double dot = 0.0;
        const auto& av = a.values();
        const auto& bv = b.values();
        for (size_t i = 0; i < av.size(); ++i) {
            dot += static_cast<double>(av[i]) * static_cast<double>(bv[i]);
        }
        return static_cast<float>(std::min(1.0, std::max(-1.0, dot)));
    }

    bool is_match(const Embedding& candidate, const Embedding& reference, float tolerance) {
        return similarity(candidate, reference) >= tolerance;
    }

    cv::Rect select_primary_face(const std::vector<cv::Rect>& faces) {
        if (faces.empty()) {
            throw RedactError(ErrorCode::NoFaceFound,
                              "No face detected in the reference image. "
                              "Please upload a clear image containing exactly one face.");
        }
        if (faces.size() > 1) {
            std::cerr << "[Matcher](select_primary_face) " << faces.size()
                      << " faces in reference image, using the largest.\n";
        }

        size_t best = 0;
        for (size_t i = 1; i < faces.size(); ++i) {
            if (faces[i].area() > faces[best].area()) best = i;
        }
        return faces[best];
    }

    Embedding load_reference(const cv::Mat& bgr, const IFaceFinder& finder) {
        if (!is_valid_image(bgr)) {
            throw RedactError(ErrorCode::InvalidImage,
                              "reference must be a non-empty 8-bit 3-channel image");
        }

        cv::Mat gray;
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

        const cv::Rect face = select_primary_face(finder.find(gray)) & cv::Rect(0, 0, gray.cols, gray.rows);
        return embed(gray(face));
    }
}
