#pragma once

#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include <inference/face_finder.hpp>

namespace sr {
    constexpr int kEmbeddingSide = 128;
    constexpr int kEmbeddingSize = kEmbeddingSide * kEmbeddingSide;

    // Unit-length appearance vector. Construction fails unless the values
    // have an L2 norm of 1.
    class Embedding {
    public:
        Embedding() = default;

        // Throws RedactError(InvalidEmbedding) if the norm is not 1.
        static Embedding from_unit_vector(std::vector<float> values);

        const std::vector<float>& values() const { return values_; }
        size_t size() const { return values_.size(); }
        bool empty() const { return values_.empty(); }

    private:
        explicit Embedding(std::vector<float> values) : values_(std::move(values)) {}

        std::vector<float> values_;
        friend Embedding embed(const cv::Mat& face_crop);
    };

    // Learning-free descriptor: 128x128 resize, histogram equalization,
    // mean removal, L2 normalization. Accepts gray or BGR crops.
    // Throws RedactError: EmptyCrop, DegenerateCrop.
    Embedding embed(const cv::Mat& face_crop);

    // Cosine similarity in [-1, 1]. Throws InvalidEmbedding on length mismatch.
    float similarity(const Embedding& a, const Embedding& b);

    bool is_match(const Embedding& candidate, const Embedding& reference, float tolerance);

    // Largest face by area; the first one wins ties. Throws NoFaceFound.
    cv::Rect select_primary_face(const std::vector<cv::Rect>& faces);

    // Finds the faces in a reference photo and embeds the primary one.
    Embedding load_reference(const cv::Mat& bgr, const IFaceFinder& finder);
}
