#include <pipeline/types.hpp>

#include <algorithm>
#include <cmath>

namespace sr {
    Label label_from_class_id(int class_id) {
        switch (class_id) {
            case 0: return Label::Face;
            case 1: return Label::LicensePlate;
            default: return Label::Unknown;
        }
    }

    const char* label_name(Label label) {
        switch (label) {
            case Label::Face: return "face";
            case Label::LicensePlate: return "license_plate";
            case Label::Unknown: return "unknown";
        }
        return "unknown";
    }

    std::string region_name(const Region& r) {
        if (r.label == Label::Unknown) return "class_" + std::to_string(r.class_id);
        return label_name(r.label);
    }

    LabelSet labels_from_targets(const BlurTargets& targets) {
        LabelSet out;
        if (targets.faces) out.insert(Label::Face);
        if (targets.plates) out.insert(Label::LicensePlate);
        return out;
    }

    cv::Rect to_pixel_rect(const Box& b, int img_w, int img_h) {
        if (!std::isfinite(b.x) || !std::isfinite(b.y) ||
            !std::isfinite(b.w) || !std::isfinite(b.h)) {
            return {};
        }
        const int x1 = static_cast<int>(std::lround(b.x));
        const int y1 = static_cast<int>(std::lround(b.y));
        const int x2 = static_cast<int>(std::lround(b.x + std::max(0.0f, b.w)));
        const int y2 = static_cast<int>(std::lround(b.y + std::max(0.0f, b.h)));

        cv::Rect r(x1, y1, std::max(0, x2 - x1), std::max(0, y2 - y1));
        r &= cv::Rect(0, 0, img_w, img_h);
        return r;
    }
}
