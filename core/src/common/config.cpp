#include <common/config.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace sr {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static float get_float(
        const YAML::Node& n, const char* key, float def) {
        return (n && n[key]) ? n[key].as<float>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static bool tolerance_in_range(float t) {
        return std::isfinite(t) && t >= -1.0f && t <= 1.0f;
    }

    int odd_kernel(int k) {
        k = std::max(3, k);
        if ((k % 2) == 0) k += 1;
        return k;
    }

    RedactionSettings RedactionSettings::normalized() const {
        const RedactionSettings def;
        RedactionSettings s = *this;
        s.min_kernel_size = odd_kernel(s.min_kernel_size);
        s.max_kernel_size = std::max(s.min_kernel_size, odd_kernel(s.max_kernel_size));
        if (!std::isfinite(s.focus_exponent) || s.focus_exponent <= 0.0f) {
            s.focus_exponent = def.focus_exponent;
        }
        if (!std::isfinite(s.base_weight)) s.base_weight = def.base_weight;
        s.base_weight = std::min(1.0f, std::max(0.0f, s.base_weight));
        return s;
    }

    static DetectorConfig parse_detector_config(const YAML::Node& d) {
        DetectorConfig c;
        if (!d) return c;
        c.param_path = get_str(d, "param_path", c.param_path);
        c.bin_path = get_str(d, "bin_path", c.bin_path);
        c.input_blob = get_str(d, "input_blob", c.input_blob);
        c.output_blob = get_str(d, "output_blob", c.output_blob);
        c.input_w = get_int(d, "input_w", c.input_w);
        c.input_h = get_int(d, "input_h", c.input_h);
        c.confidence_threshold = get_float(d, "confidence_threshold", c.confidence_threshold);
        c.iou_threshold = get_float(d, "iou_threshold", c.iou_threshold);
        c.top_k = get_int(d, "top_k", c.top_k);
        c.ncnn_threads = get_int(d, "ncnn_threads", c.ncnn_threads);

        if (c.confidence_threshold < 0.0f || c.confidence_threshold > 1.0f) {
            throw std::runtime_error("[Config] detector.confidence_threshold must be in [0, 1]!");
        }
        if (c.iou_threshold <= 0.0f || c.iou_threshold > 1.0f) {
            throw std::runtime_error("[Config] detector.iou_threshold must be in (0, 1]!");
        }
        if (c.top_k < 0) c.top_k = 0;
        return c;
    }

    static RedactionSettings parse_redaction_settings(const YAML::Node& r) {
        RedactionSettings c;
        if (!r) return c;
        c.min_kernel_size = get_int(r, "min_kernel_size", c.min_kernel_size);
        c.max_kernel_size = get_int(r, "max_kernel_size", c.max_kernel_size);
        c.focus_exponent = get_float(r, "focus_exponent", c.focus_exponent);
        c.base_weight = get_float(r, "base_weight", c.base_weight);
        return c.normalized();
    }

    static BlurTargets parse_blur_targets(const YAML::Node& t) {
        BlurTargets c;
        if (!t) return c;
        c.faces = get_bool(t, "faces", c.faces);
        c.plates = get_bool(t, "plates", c.plates);
        return c;
    }

    static MatcherConfig parse_matcher_config(const YAML::Node& m) {
        MatcherConfig c;
        if (!m) return c;
        c.tolerance = get_float(m, "tolerance", c.tolerance);
        c.blur_kernel = odd_kernel(get_int(m, "blur_kernel", c.blur_kernel));
        c.cascade_path = get_str(m, "cascade_path", c.cascade_path);
        c.scale_factor = static_cast<double>(get_float(m, "scale_factor", static_cast<float>(c.scale_factor)));
        c.min_neighbors = get_int(m, "min_neighbors", c.min_neighbors);
        c.min_face_size = get_int(m, "min_face_size", c.min_face_size);

        if (!tolerance_in_range(c.tolerance)) {
            throw std::runtime_error("[Config] matcher.tolerance must be in [-1, 1]!");
        }
        if (c.scale_factor <= 1.0) {
            throw std::runtime_error("[Config] matcher.scale_factor must be > 1!");
        }
        return c;
    }

    float parse_tolerance(const std::string& text) {
        float t = 0.0f;
        size_t used = 0;
        try {
            t = std::stof(text, &used);
        } catch (const std::invalid_argument&) {
            used = 0;
        } catch (const std::out_of_range&) {
            used = 0;
        }
        if (used == 0 || used != text.size() || !tolerance_in_range(t)) {
            throw std::invalid_argument("[Config] tolerance must be a number in [-1, 1], got '" + text + "'");
        }
        return t;
    }

    int parse_kernel_size(const std::string& text) {
        int k = 0;
        size_t used = 0;
        try {
            k = std::stoi(text, &used);
        } catch (const std::invalid_argument&) {
            used = 0;
        } catch (const std::out_of_range&) {
            used = 0;
        }
        if (used == 0 || used != text.size() || k <= 0) {
            throw std::invalid_argument("[Config] kernel must be a positive integer, got '" + text + "'");
        }
        return odd_kernel(k);
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.detector = parse_detector_config(root["detector"]);
        cfg.redaction = parse_redaction_settings(root["redaction"]);
        cfg.targets = parse_blur_targets(root["blur"]);
        cfg.matcher = parse_matcher_config(root["matcher"]);
        return cfg;
    }
}
