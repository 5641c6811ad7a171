#include <matching/embedding_io.hpp>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <common/errors.hpp>

namespace sr {
    namespace {
        constexpr char kMagic[4] = {'S', 'R', 'E', 'M'};
        constexpr uint32_t kVersion = 1;
        constexpr uint32_t kMaxValues = 1u << 24;
    } // namespace

    void save_embedding(const std::string& path, const Embedding& e) {
        namespace fs = std::filesystem;
        const fs::path p(path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());

        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open embedding file for writing: " + path);
        }

        const uint32_t count = static_cast<uint32_t>(e.size());
        out.write(kMagic, sizeof(kMagic));
        out.write(reinterpret_cast<const char*>(&kVersion), sizeof(kVersion));
        out.write(reinterpret_cast<const char*>(&count), sizeof(count));
        out.write(reinterpret_cast<const char*>(e.values().data()),
                  static_cast<std::streamsize>(e.size() * sizeof(float)));
        if (!out) {
            throw std::runtime_error("failed to write embedding file: " + path);
        }
    }

    Embedding load_embedding(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("embedding file does not exist or cannot be read: " + path);
        }

        char magic[4] = {};
        uint32_t version = 0;
        uint32_t count = 0;
        in.read(magic, sizeof(magic));
        in.read(reinterpret_cast<char*>(&version), sizeof(version));
        in.read(reinterpret_cast<char*>(&count), sizeof(count));
        if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
            throw RedactError(ErrorCode::InvalidEmbedding, "not an embedding file: " + path);
        }
        if (version != kVersion) {
            throw RedactError(ErrorCode::InvalidEmbedding,
                              "unsupported embedding version " + std::to_string(version));
        }
        if (count == 0 || count > kMaxValues) {
            throw RedactError(ErrorCode::InvalidEmbedding,
                              "implausible embedding length " + std::to_string(count));
        }

        std::vector<float> values(count);
        in.read(reinterpret_cast<char*>(values.data()),
                static_cast<std::streamsize>(count * sizeof(float)));
        if (!in) {
            throw RedactError(ErrorCode::InvalidEmbedding, "truncated embedding file: " + path);
        }
        return Embedding::from_unit_vector(std::move(values));
    }
}
