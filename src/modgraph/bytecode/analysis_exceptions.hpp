/**
 * @file analysis_exceptions.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

/**
 * @brief Error codes for compiled-unit analysis.
 */
enum class AnalysisErrorCode
{
    /// The instruction stream breaks a positional-operand invariant, or an operand
    /// refers outside the constant pool or names table.
    StructuralViolation,
    /// The caller passed something that is not a compiled unit (e.g. a null pointer).
    InvalidArgument,
    /// More units were reached than `AnalyzerConfig::max_units` allows.
    UnitLimitExceeded
};

/**
 * @brief Returns a stable name for an error code, for messages and logs.
 */
inline const char* analysis_error_code_name(AnalysisErrorCode code) noexcept
{
    switch (code)
    {
    case AnalysisErrorCode::StructuralViolation:
        return "StructuralViolation";
    case AnalysisErrorCode::InvalidArgument:
        return "InvalidArgument";
    case AnalysisErrorCode::UnitLimitExceeded:
        return "UnitLimitExceeded";
    }
    return "Unknown";
}

/**
 * @brief Exception class for analysis errors.
 *
 * @details
 * `AnalysisError` is thrown by `InstructionAnalyzer` and by the checked accessors of
 * `CompiledUnit`. A structural violation means the compiled unit is corrupt or in an
 * unsupported format; analyzing the same input again fails the same way.
 *
 * @par Thread safety
 * - Standard exception semantics; safe to copy and rethrow across threads.
 */
class AnalysisError : public std::exception
{
public:
    /**
     * @brief Construct an AnalysisError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message naming the unit and instruction offset.
     */
    AnalysisError(AnalysisErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    AnalysisErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    AnalysisErrorCode m_code;
    std::string m_message;
};

} // namespace modgraph
