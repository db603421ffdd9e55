#include "../include/errors.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::IndexNotReady: return "IndexNotReady";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::EmptyQuery: return "EmptyQuery";
        case ErrorCode::EmptyCorpus: return "EmptyCorpus";
        case ErrorCode::EmbeddingServiceError: return "EmbeddingServiceError";
        case ErrorCode::GenerationServiceError: return "GenerationServiceError";
        case ErrorCode::NoValidDocuments: return "NoValidDocuments";
        case ErrorCode::RebuildFailed: return "RebuildFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}
