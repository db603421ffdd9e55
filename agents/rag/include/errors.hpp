#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
    IndexNotReady,
    NotFound,
    EmptyQuery,
    EmptyCorpus,
    EmbeddingServiceError,
    GenerationServiceError,
    NoValidDocuments,
    RebuildFailed,
    InvalidArgument
};

const char* error_code_name(ErrorCode code);

class RagError : public std::runtime_error {
public:
    RagError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};
