/**
 * @file graph_types.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` is the position of a node in the graph's node arena. Indices are assigned
 * in insertion order starting at 0 and never change, since nodes are never removed.
 * This alias exists for clarity in API signatures, not for compile-time type safety.
 */
using NodeIdx = std::size_t;

/**
 * @brief Directed edge key, as (source, destination).
 */
using EdgeKey = std::pair<NodeIdx, NodeIdx>;

// ============================================================================
// Node capability
// ============================================================================

/**
 * @brief How the graph obtains a node's identifier.
 *
 * @details
 * The default requires `Node` to expose `identifier()` returning something convertible
 * to `std::string`. Specialize for node types that name their identifier differently.
 * The identifier must be stable for as long as the node is in a graph.
 */
template <typename Node>
struct NodeIdentity
{
    static std::string identifier(const Node& node)
    {
        return std::string(node.identifier());
    }
};

} // namespace modgraph
