#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace newscheckr {

// Stable, wire-level error codes. Never renumber or rename.
enum class ErrorCode {
    InputError,
    ScrapeError,
    Timeout,
    InsufficientContent,
    SummarizationError,
    ModelUnavailable
};

enum class ScrapeFailure {
    Unreachable,
    Paywalled,
    NoContent,
    MalformedUrl
};

const char* error_code_str(ErrorCode code);
const char* scrape_failure_str(ScrapeFailure reason);

class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

// Malformed URL or empty text. Rejected before any pipeline work.
class InputError : public AnalysisError {
public:
    explicit InputError(const std::string& message);
};

class ScrapeError : public AnalysisError {
public:
    ScrapeError(ScrapeFailure reason, const std::string& message);

    ScrapeFailure reason() const { return m_reason; }

    // Only plain network unreachability earns the single automatic retry.
    bool transient() const { return code() == ErrorCode::ScrapeError && m_reason == ScrapeFailure::Unreachable; }

protected:
    ScrapeError(ErrorCode code, ScrapeFailure reason, const std::string& message);

private:
    ScrapeFailure m_reason;
};

class TimeoutError : public ScrapeError {
public:
    explicit TimeoutError(const std::string& message);
};

class InsufficientContentError : public AnalysisError {
public:
    InsufficientContentError(size_t word_count, size_t min_words);

    size_t word_count() const { return m_word_count; }

private:
    size_t m_word_count;
};

class SummarizationError : public AnalysisError {
public:
    explicit SummarizationError(const std::string& message);
};

// Classifier parameters missing or invalid. Fatal: the service refuses to analyze.
class ModelUnavailableError : public AnalysisError {
public:
    explicit ModelUnavailableError(const std::string& message);
};

}  // namespace newscheckr
