/**
 * @file dependency_graph.inline.hpp
 * @brief Implementations of the DependencyGraph member functions.
 */
#pragma once
#include "modgraph/graph/dependency_graph.hpp"

#include <sstream>

namespace modgraph
{

// ============================================================================
// Mutation
// ============================================================================

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_node(const NodePtr& node)
{
    if (!node)
    {
        throw DependencyGraphError(DependencyGraphErrorCode::InvalidArgument,
                                   "Cannot add a null node");
    }

    auto [index, inserted] = m_nodes.try_insert(node);
    if (!inserted)
    {
        throw DependencyGraphError(DependencyGraphErrorCode::DuplicateNode,
                                   "Already have node with identifier '" +
                                       m_nodes.identifier_at(index) + "'");
    }

    m_is_root.push_back(false);
    m_successors.emplace_back();
    m_predecessors.emplace_back();

    m_log.trc("added node", redlog::field("identifier", m_nodes.identifier_at(index)),
              redlog::field("index", index));
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_root(const std::string& identifier)
{
    NodeIdx index = require_node(identifier, "Root");
    if (m_is_root[index])
    {
        return;
    }
    m_is_root[index] = true;
    m_root_order.push_back(index);
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_root(const NodePtr& node)
{
    add_root(identifier_of(node, "Root"));
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_edge(const std::string& source,
                                                         const std::string& destination,
                                                         EdgeAttr attribute,
                                                         const MergeFn& merge)
{
    NodeIdx from = require_node(source, "Source");
    NodeIdx to = require_node(destination, "Destination");
    add_edge_impl(from, to, std::move(attribute), merge);
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_edge(const NodePtr& source,
                                                         const NodePtr& destination,
                                                         EdgeAttr attribute,
                                                         const MergeFn& merge)
{
    add_edge(identifier_of(source, "Source"), identifier_of(destination, "Destination"),
             std::move(attribute), merge);
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::add_edge_impl(NodeIdx source,
                                                              NodeIdx destination,
                                                              EdgeAttr attribute,
                                                              const MergeFn& merge)
{
    EdgeKey key{source, destination};
    auto it = m_edges.find(key);
    if (it == m_edges.end())
    {
        auto& successors = m_successors[source];
        auto& predecessors = m_predecessors[destination];
        auto inserted = m_edges.emplace(key, std::move(attribute)).first;
        try
        {
            successors.push_back(destination);
            predecessors.push_back(source);
        }
        catch (...)
        {
            if (!successors.empty() && successors.back() == destination)
            {
                successors.pop_back();
            }
            m_edges.erase(inserted);
            throw;
        }

        m_log.trc("added edge", redlog::field("source", m_nodes.identifier_at(source)),
                  redlog::field("destination", m_nodes.identifier_at(destination)));
        return;
    }

    if (!merge)
    {
        throw DependencyGraphError(DependencyGraphErrorCode::DuplicateEdge,
                                   "Edge between '" + m_nodes.identifier_at(source) + "' and '" +
                                       m_nodes.identifier_at(destination) + "' already exists");
    }

    EdgeAttr merged = merge(it->second, attribute);
    it->second = std::move(merged);

    m_log.dbg("merged edge", redlog::field("source", m_nodes.identifier_at(source)),
              redlog::field("destination", m_nodes.identifier_at(destination)));
}

// ============================================================================
// Lookup
// ============================================================================

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NodePtr
DependencyGraph<Node, EdgeAttr, Identity>::find_node(const std::string& identifier) const
{
    std::size_t index = m_nodes.find(identifier);
    if (index == NodeArena<Node, Identity>::npos)
    {
        return nullptr;
    }
    return m_nodes.at(index);
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NodePtr
DependencyGraph<Node, EdgeAttr, Identity>::find_node(const NodePtr& node) const
{
    if (!node)
    {
        return nullptr;
    }
    return find_node(identifier_of(node, "Lookup"));
}

template <typename Node, typename EdgeAttr, typename Identity>
bool DependencyGraph<Node, EdgeAttr, Identity>::contains(const std::string& identifier) const
{
    return m_nodes.find(identifier) != NodeArena<Node, Identity>::npos;
}

template <typename Node, typename EdgeAttr, typename Identity>
bool DependencyGraph<Node, EdgeAttr, Identity>::contains(const NodePtr& node) const
{
    return find_node(node) != nullptr;
}

template <typename Node, typename EdgeAttr, typename Identity>
const EdgeAttr& DependencyGraph<Node, EdgeAttr, Identity>::edge_data(
    const std::string& source, const std::string& destination) const
{
    NodeIdx from = require_node(source, "Source");
    NodeIdx to = require_node(destination, "Destination");
    auto it = m_edges.find(EdgeKey{from, to});
    if (it == m_edges.end())
    {
        throw DependencyGraphError(DependencyGraphErrorCode::NoSuchEdge,
                                   "There is no edge between '" + source + "' and '" +
                                       destination + "'");
    }
    return it->second;
}

template <typename Node, typename EdgeAttr, typename Identity>
const EdgeAttr& DependencyGraph<Node, EdgeAttr, Identity>::edge_data(
    const NodePtr& source, const NodePtr& destination) const
{
    return edge_data(identifier_of(source, "Source"), identifier_of(destination, "Destination"));
}

template <typename Node, typename EdgeAttr, typename Identity>
bool DependencyGraph<Node, EdgeAttr, Identity>::has_edge(const std::string& source,
                                                         const std::string& destination) const
{
    std::size_t from = m_nodes.find(source);
    std::size_t to = m_nodes.find(destination);
    if (from == NodeArena<Node, Identity>::npos || to == NodeArena<Node, Identity>::npos)
    {
        return false;
    }
    return m_edges.count(EdgeKey{from, to}) != 0;
}

// ============================================================================
// Iteration
// ============================================================================

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NeighborRange
DependencyGraph<Node, EdgeAttr, Identity>::outgoing(const std::string& source) const
{
    std::size_t index = m_nodes.find(source);
    if (index == NodeArena<Node, Identity>::npos)
    {
        return NeighborRange();
    }
    return NeighborRange(this, index, true);
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NeighborRange
DependencyGraph<Node, EdgeAttr, Identity>::outgoing(const NodePtr& source) const
{
    if (!source)
    {
        return NeighborRange();
    }
    return outgoing(identifier_of(source, "Source"));
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NeighborRange
DependencyGraph<Node, EdgeAttr, Identity>::incoming(const std::string& destination) const
{
    std::size_t index = m_nodes.find(destination);
    if (index == NodeArena<Node, Identity>::npos)
    {
        return NeighborRange();
    }
    return NeighborRange(this, index, false);
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::NeighborRange
DependencyGraph<Node, EdgeAttr, Identity>::incoming(const NodePtr& destination) const
{
    if (!destination)
    {
        return NeighborRange();
    }
    return incoming(identifier_of(destination, "Destination"));
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::ReachableRange
DependencyGraph<Node, EdgeAttr, Identity>::iter_graph() const
{
    return ReachableRange(this, m_root_order);
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::ReachableRange
DependencyGraph<Node, EdgeAttr, Identity>::iter_graph(const std::string& start) const
{
    NodeIdx index = require_node(start, "Start");
    return ReachableRange(this, std::vector<NodeIdx>{index});
}

template <typename Node, typename EdgeAttr, typename Identity>
typename DependencyGraph<Node, EdgeAttr, Identity>::ReachableRange
DependencyGraph<Node, EdgeAttr, Identity>::iter_graph(const NodePtr& start) const
{
    return iter_graph(identifier_of(start, "Start"));
}

template <typename Node, typename EdgeAttr, typename Identity>
DependencyGraph<Node, EdgeAttr, Identity>::ReachableRange::iterator::iterator(
    const DependencyGraph* graph, const std::vector<NodeIdx>& starts)
    : m_graph(graph)
    , m_state(std::make_shared<State>())
{
    m_state->starts = starts;
    m_state->visited.assign(graph->node_count(), false);
    advance();
}

template <typename Node, typename EdgeAttr, typename Identity>
void DependencyGraph<Node, EdgeAttr, Identity>::ReachableRange::iterator::advance()
{
    State& state = *m_state;
    while (true)
    {
        if (!state.stack.empty())
        {
            NodeIdx index = state.stack.back();
            state.stack.pop_back();
            if (state.visited[index])
            {
                continue;
            }
            state.visited[index] = true;

            // Reverse push so successors are explored in edge insertion order.
            const auto& successors = m_graph->m_successors[index];
            for (auto it = successors.rbegin(); it != successors.rend(); ++it)
            {
                if (!state.visited[*it])
                {
                    state.stack.push_back(*it);
                }
            }
            state.current = index;
            return;
        }

        if (state.next_start < state.starts.size())
        {
            state.stack.push_back(state.starts[state.next_start++]);
            continue;
        }

        // Exhausted: become the end iterator.
        m_state.reset();
        return;
    }
}

template <typename Node, typename EdgeAttr, typename Identity>
std::string DependencyGraph<Node, EdgeAttr, Identity>::describe() const
{
    std::ostringstream oss;
    oss << "<DependencyGraph with " << root_count() << " roots, " << node_count()
        << " nodes and " << edge_count() << " edges>";
    return oss.str();
}

// ============================================================================
// Helpers
// ============================================================================

template <typename Node, typename EdgeAttr, typename Identity>
NodeIdx DependencyGraph<Node, EdgeAttr, Identity>::require_node(const std::string& identifier,
                                                                const char* role) const
{
    std::size_t index = m_nodes.find(identifier);
    if (index == NodeArena<Node, Identity>::npos)
    {
        throw DependencyGraphError(DependencyGraphErrorCode::NodeNotFound,
                                   std::string(role) + " '" + identifier + "' not found");
    }
    return index;
}

template <typename Node, typename EdgeAttr, typename Identity>
std::string DependencyGraph<Node, EdgeAttr, Identity>::identifier_of(const NodePtr& node,
                                                                     const char* role)
{
    if (!node)
    {
        throw DependencyGraphError(DependencyGraphErrorCode::InvalidArgument,
                                   std::string(role) + " node is null");
    }
    return Identity::identifier(*node);
}

} // namespace modgraph
