/**
 * @file import_edge.hpp
 * @brief Edge attribute for module-to-module import relationships.
 */
#pragma once
#include "modgraph/common/common.hpp"
#include "modgraph/bytecode/analysis_result.hpp"

namespace modgraph
{

/**
 * @brief What one module's imports of another module amount to.
 *
 * @details
 * A caller resolving `ImportRecord`s into graph edges stores an `ImportEdge` on each
 * edge. When several import statements link the same pair of modules, the edges are
 * combined with `merge_import_edges()`:
 * - `imported_names`: union.
 * - `has_star_import`: true if any statement was a star import.
 * - `is_optional`: true only if every statement was optional, since one unconditional
 *   import makes the dependency unconditional.
 */
struct ImportEdge
{
    std::set<std::string> imported_names;
    bool has_star_import{false};
    bool is_optional{false};

    /**
     * @brief The attribute contributed by a single import statement.
     */
    static ImportEdge from_record(const ImportRecord& record);

    /**
     * @brief This edge combined with `other`.
     */
    ImportEdge merged_with(const ImportEdge& other) const;
};

/**
 * @brief Merge function suitable for `DependencyGraph::add_edge`.
 */
ImportEdge merge_import_edges(const ImportEdge& existing, const ImportEdge& incoming);

inline bool operator==(const ImportEdge& lhs, const ImportEdge& rhs)
{
    return lhs.imported_names == rhs.imported_names &&
           lhs.has_star_import == rhs.has_star_import && lhs.is_optional == rhs.is_optional;
}

inline bool operator!=(const ImportEdge& lhs, const ImportEdge& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ImportEdge& edge);

} // namespace modgraph
