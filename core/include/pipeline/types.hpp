#pragma once

#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <vector>

#include <common/config.hpp>

namespace sr {
    enum class Label {
        Face,
        LicensePlate,
        Unknown
    };

    using LabelSet = std::set<Label>;

    struct Box {
        float x = 0.0f;
        float y = 0.0f;
        float w = 0.0f;
        float h = 0.0f;
    };

    struct Region {
        Label label = Label::Unknown;
        int class_id = -1;
        float confidence = 0.0f;
        Box box;
    };

    // Class ids as exported by the detector training: 0 face, 1 license plate.
    Label label_from_class_id(int class_id);

    // "face", "license_plate" or "class_{id}" for anything unrecognized.
    std::string region_name(const Region& r);
    const char* label_name(Label label);

    LabelSet labels_from_targets(const BlurTargets& targets);

    // Integer pixel rect covering the box, clipped to the image.
    cv::Rect to_pixel_rect(const Box& b, int img_w, int img_h);

    struct DetectionReport {
        std::vector<Region> regions;
        int total = 0;
        int face_count = 0;
        int plate_count = 0;
        int other_count = 0;
        double processing_ms = 0.0;
        RedactionSettings settings;
    };

    struct FaceStatistics {
        int total_faces = 0;
        int matched_faces = 0;
        int blurred_faces = 0;
        int unmatchable_faces = 0; // blurred because no embedding could be computed
        double processing_ms = 0.0;
    };
}
