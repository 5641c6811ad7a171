#pragma once

#include <string>

#include <matching/reference_matcher.hpp>

namespace sr {
    // Binary layout: "SREM", uint32 version, uint32 count, count x float32.
    // Host byte order.
    void save_embedding(const std::string& path, const Embedding& e);

    // Throws RedactError(InvalidEmbedding) on a malformed file and
    // std::runtime_error if the file cannot be opened.
    Embedding load_embedding(const std::string& path);
}
