// File: include/core/AnalysisError.hpp
//
// Error value returned by validation and report assembly.

#ifndef LUCIDLOG_CORE_ANALYSIS_ERROR_HPP
#define LUCIDLOG_CORE_ANALYSIS_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace core
{

/**
 * @brief Category of a failed report request.
 *
 * Empty collections are not an error and have no kind here: every metric
 * that would divide by zero has its own "no data" representation.
 */
enum class AnalysisErrorKind : std::uint8_t
{
    MalformedInput = 0,   ///< A record in the snapshot violates an invariant.
    ConfigurationError    ///< The report request itself is invalid.
};

inline const char* analysisErrorKindToString(AnalysisErrorKind kind) noexcept
{
    switch (kind)
    {
    case AnalysisErrorKind::MalformedInput:     return "MalformedInput";
    case AnalysisErrorKind::ConfigurationError: return "ConfigurationError";
    default:                                    return "Unknown";
    }
}

/**
 * @brief Diagnostic describing why no report was produced.
 *
 * rule names the violated invariant (e.g. "duplicate-dream-id"), subject
 * the offending record or setting (e.g. "dream #12", "log 2024-02-01",
 * "top_words"), and detail carries the human-readable explanation.
 */
struct AnalysisError
{
    AnalysisErrorKind kind{AnalysisErrorKind::MalformedInput};
    std::string       rule;
    std::string       subject;
    std::string       detail;

    /// Single-line message suitable for showing to the user.
    std::string describe() const
    {
        std::string out = analysisErrorKindToString(kind);
        out += " [";
        out += rule;
        out += "] ";
        out += subject;
        if (!detail.empty())
        {
            out += ": ";
            out += detail;
        }
        return out;
    }
};

inline AnalysisError malformedInput(std::string rule, std::string subject, std::string detail)
{
    return AnalysisError{AnalysisErrorKind::MalformedInput,
                         std::move(rule), std::move(subject), std::move(detail)};
}

inline AnalysisError configurationError(std::string rule, std::string subject, std::string detail)
{
    return AnalysisError{AnalysisErrorKind::ConfigurationError,
                         std::move(rule), std::move(subject), std::move(detail)};
}

} // namespace core

#endif // LUCIDLOG_CORE_ANALYSIS_ERROR_HPP
