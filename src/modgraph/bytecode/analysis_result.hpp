/**
 * @file analysis_result.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

/**
 * @brief The kind of body a compiled unit is.
 *
 * @details
 * The scope kind decides whether name bindings and lookups in a unit affect the
 * module namespace:
 * - `Module`: bindings are module globals.
 * - `Function`: imports may run zero or many times; only explicit global access counts.
 * - `Class`: bindings populate the class namespace; global lookups still count.
 */
enum class ScopeKind
{
    Module,
    Function,
    Class
};

inline const char* scope_kind_name(ScopeKind kind) noexcept
{
    switch (kind)
    {
    case ScopeKind::Module:
        return "module";
    case ScopeKind::Function:
        return "function";
    case ScopeKind::Class:
        return "class";
    }
    return "unknown";
}

/**
 * @brief One import statement found in a compiled unit tree.
 *
 * @par Invariants
 * - `names` never contains `"*"`; a star import is flagged by `has_star_import` alone.
 * - `level == 0` means an absolute import.
 */
struct ImportRecord
{
    /// Module operand of the import, e.g. "a.b.c", or "" for `from . import x`.
    std::string module;

    /// Relative-import depth.
    std::int64_t level{0};

    /// Explicit names of a `from ... import` statement.
    std::set<std::string> names;

    bool has_star_import{false};

    /// True if the import is inside a function body (it may never execute, or execute
    /// many times).
    bool is_conditional{false};

    bool is_optional() const noexcept
    {
        return is_conditional;
    }
};

inline bool operator==(const ImportRecord& lhs, const ImportRecord& rhs)
{
    return lhs.module == rhs.module && lhs.level == rhs.level && lhs.names == rhs.names &&
           lhs.has_star_import == rhs.has_star_import &&
           lhs.is_conditional == rhs.is_conditional;
}

inline bool operator!=(const ImportRecord& lhs, const ImportRecord& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ImportRecord& record);

/**
 * @brief Everything extracted from one compiled unit tree.
 *
 * @details
 * `imports` is in discovery order: a unit's imports in instruction order, units in
 * breadth-first order with parents before children and siblings in constant-pool
 * order. `globals_written` and `globals_read` are the module-level names bound and
 * looked up, across the whole tree.
 */
struct AnalysisResult
{
    std::vector<ImportRecord> imports;
    std::set<std::string> globals_written;
    std::set<std::string> globals_read;

    /**
     * @brief Append `other`'s imports and union its name sets into this result.
     */
    void merge(AnalysisResult&& other);
};

} // namespace modgraph
