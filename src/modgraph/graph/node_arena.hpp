/**
 * @file node_arena.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"
#include "modgraph/graph/graph_types.hpp"

namespace modgraph
{

/**
 * @brief Dense, insertion-ordered storage of graph nodes keyed by identifier.
 *
 * @details
 * `NodeArena<T>` stores `std::shared_ptr<T>` nodes in a `std::vector` and maps each
 * node's identifier to its position with a `std::unordered_map`. The identifier is read
 * once, at insertion, through `Identity::identifier()`, and kept alongside the node.
 *
 * @par Index semantics
 * - Indices are assigned sequentially starting from 0.
 * - The index of a newly inserted node equals the previous `size()`.
 * - `npos` (value: `SIZE_MAX`) represents "not found" in `find()` results.
 *
 * @par Duplicate handling
 * - `try_insert()` returns the existing index and `false` if the identifier is already
 *   present; the arena is not modified.
 *
 * @par Invariants
 * - For all `i` in `[0, size())`: `find(identifier_at(i)) == i`.
 * - No null node is ever stored.
 *
 * @par Exception safety
 * - `try_insert()` provides the strong exception guarantee. Storage grows geometrically,
 *   so insertion is amortized O(1).
 * - `find()` and `size()` are `noexcept`.
 * - `at()` and `identifier_at()` throw `std::out_of_range` for invalid indices.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const operations) are safe.
 */
template <typename T, typename Identity = NodeIdentity<T>>
class NodeArena
{
public:
    using NodePtr = std::shared_ptr<T>;

    /**
     * @brief Sentinel value indicating "not found" (equal to `SIZE_MAX`).
     */
    static constexpr std::size_t npos = ~static_cast<std::size_t>(0);

public:
    /**
     * @brief Insert a node unless its identifier is already present.
     * @param node The node to insert. Must not be null.
     * @return (index, inserted): the new index and true, or the index of the node that
     *         already has this identifier and false.
     * @throw std::invalid_argument if `node` is null.
     */
    std::pair<NodeIdx, bool> try_insert(const NodePtr& node)
    {
        if (!node)
        {
            throw std::invalid_argument("NodeArena::try_insert: null node");
        }
        std::string identifier = Identity::identifier(*node);
        auto it = m_index.find(identifier);
        if (it != m_index.end())
        {
            return {it->second, false};
        }
        NodeIdx index = m_nodes.size();
        m_nodes.push_back(node);
        try
        {
            m_identifiers.push_back(identifier);
            m_index.emplace(std::move(identifier), index);
        }
        catch (...)
        {
            // Roll back so a failed insert leaves the arena unchanged.
            m_identifiers.resize(index);
            m_nodes.pop_back();
            throw;
        }
        return {index, true};
    }

    /**
     * @brief Find the index of the node with the given identifier.
     * @return The index if found; otherwise, `npos`.
     */
    std::size_t find(const std::string& identifier) const noexcept
    {
        auto it = m_index.find(identifier);
        if (it != m_index.end())
        {
            return it->second;
        }
        return npos;
    }

    /**
     * @brief Access the node at the given index.
     * @throw std::out_of_range if `index >= size()`.
     */
    const NodePtr& at(NodeIdx index) const
    {
        if (index >= m_nodes.size())
        {
            throw std::out_of_range("NodeArena::at: index out of range");
        }
        return m_nodes[index];
    }

    /**
     * @brief The identifier recorded for the node at the given index.
     * @throw std::out_of_range if `index >= size()`.
     */
    const std::string& identifier_at(NodeIdx index) const
    {
        if (index >= m_identifiers.size())
        {
            throw std::out_of_range("NodeArena::identifier_at: index out of range");
        }
        return m_identifiers[index];
    }

    std::size_t size() const noexcept
    {
        return m_nodes.size();
    }

    /**
     * @brief All nodes, in insertion order.
     */
    const std::vector<NodePtr>& nodes() const noexcept
    {
        return m_nodes;
    }

private:
    std::vector<NodePtr> m_nodes;
    std::vector<std::string> m_identifiers;
    std::unordered_map<std::string, NodeIdx> m_index;
};

} // namespace modgraph
