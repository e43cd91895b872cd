#include "news/Errors.hpp"

namespace newscheckr {

const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::InputError: return "input_error";
        case ErrorCode::ScrapeError: return "scrape_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::InsufficientContent: return "insufficient_content";
        case ErrorCode::SummarizationError: return "summarization_error";
        case ErrorCode::ModelUnavailable: return "model_unavailable";
        default: return "unknown";
    }
}

const char* scrape_failure_str(ScrapeFailure reason) {
    switch (reason) {
        case ScrapeFailure::Unreachable: return "unreachable";
        case ScrapeFailure::Paywalled: return "paywalled";
        case ScrapeFailure::NoContent: return "no-content";
        case ScrapeFailure::MalformedUrl: return "malformed-url";
        default: return "unknown";
    }
}

AnalysisError::AnalysisError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), m_code(code) {}

InputError::InputError(const std::string& message)
    : AnalysisError(ErrorCode::InputError, message) {}

ScrapeError::ScrapeError(ScrapeFailure reason, const std::string& message)
    : AnalysisError(ErrorCode::ScrapeError, message), m_reason(reason) {}

ScrapeError::ScrapeError(ErrorCode code, ScrapeFailure reason, const std::string& message)
    : AnalysisError(code, message), m_reason(reason) {}

TimeoutError::TimeoutError(const std::string& message)
    : ScrapeError(ErrorCode::Timeout, ScrapeFailure::Unreachable, message) {}

InsufficientContentError::InsufficientContentError(size_t word_count, size_t min_words)
    : AnalysisError(ErrorCode::InsufficientContent,
                    "too little content to classify: " + std::to_string(word_count) +
                    " words, need " + std::to_string(min_words)),
      m_word_count(word_count) {}

SummarizationError::SummarizationError(const std::string& message)
    : AnalysisError(ErrorCode::SummarizationError, message) {}

ModelUnavailableError::ModelUnavailableError(const std::string& message)
    : AnalysisError(ErrorCode::ModelUnavailable, message) {}

}  // namespace newscheckr
