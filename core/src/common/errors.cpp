#include <common/errors.hpp>

namespace sr {
    const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::InvalidImage: return "InvalidImage";
            case ErrorCode::ModelNotLoaded: return "ModelNotLoaded";
            case ErrorCode::InferenceFailure: return "InferenceFailure";
            case ErrorCode::NoFaceFound: return "NoFaceFound";
            case ErrorCode::EmptyCrop: return "EmptyCrop";
            case ErrorCode::DegenerateCrop: return "DegenerateCrop";
            case ErrorCode::InvalidEmbedding: return "InvalidEmbedding";
        }
        return "Unknown";
    }

    ErrorCategory category_of(ErrorCode code) {
        switch (code) {
            case ErrorCode::ModelNotLoaded:
            case ErrorCode::InferenceFailure:
                return ErrorCategory::ProcessingFailure;
            default:
                return ErrorCategory::BadInput;
        }
    }

    RedactError::RedactError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string("[") + error_code_name(code) + "] " + message),
          code_(code) {}
}
