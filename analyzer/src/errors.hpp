#pragma once

#include <stdexcept>
#include <string>

enum class FailureKind {
    DataUnavailable,  // transport failure, timeout, empty series
    InsufficientData, // fewer bars than the analysis needs
    ComputationError  // numeric degeneracy
};

inline const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::DataUnavailable:  return "data_unavailable";
        case FailureKind::InsufficientData: return "insufficient_data";
        case FailureKind::ComputationError: return "computation_error";
    }
    return "computation_error";
}

// Thrown by pipeline stages, caught at the Analyzer boundary
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(FailureKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

struct NoResult {
    FailureKind kind;
    std::string detail; // for logs only, never shown to the presentation layer
};
