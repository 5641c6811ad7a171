#pragma once

#include <stdexcept>
#include <string>

namespace sr {
    enum class ErrorCode {
        InvalidImage,
        ModelNotLoaded,
        InferenceFailure,
        NoFaceFound,
        EmptyCrop,
        DegenerateCrop,
        InvalidEmbedding
    };

    // Lets a host tell "fix your input" apart from "we failed" when it maps
    // errors onto its own status codes.
    enum class ErrorCategory {
        BadInput,
        ProcessingFailure
    };

    const char* error_code_name(ErrorCode code);
    ErrorCategory category_of(ErrorCode code);

    class RedactError : public std::runtime_error {
    public:
        RedactError(ErrorCode code, const std::string& message);

        ErrorCode code() const noexcept { return code_; }
        ErrorCategory category() const noexcept { return category_of(code_); }
        bool is_bad_input() const noexcept { return category() == ErrorCategory::BadInput; }

    private:
        ErrorCode code_;
    };
}
