/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

/**
 * @brief Error codes for DependencyGraph operations.
 *
 * @details
 * All of these are caller logic errors. The graph is in-memory and deterministic, so
 * repeating a failed call fails the same way.
 */
enum class DependencyGraphErrorCode
{
    DuplicateNode,
    DuplicateEdge,
    NodeNotFound,
    NoSuchEdge,
    InvalidArgument
};

/**
 * @brief Exception class for DependencyGraph errors.
 *
 * @details
 * `DependencyGraphError` is thrown by `DependencyGraph` methods when a node or edge
 * that must exist is absent, or one that must not exist is already present. Each
 * exception carries an error code and a message naming the identifiers involved.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class DependencyGraphError : public std::exception
{
public:
    /**
     * @brief Construct a DependencyGraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    DependencyGraphError(DependencyGraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     * @return The error code for this exception.
     */
    DependencyGraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     * @return A C-string describing the error.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    DependencyGraphErrorCode m_code;
    std::string m_message;
};

} // namespace modgraph
