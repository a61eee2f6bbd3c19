/**
 * @file dependency_graph.hpp
 * @brief Definition of the DependencyGraph class template.
 * @see dependency_graph.inline.hpp for the member function implementations.
 */
#pragma once
#include "modgraph/common/common.hpp"
#include "modgraph/graph/graph_exceptions.hpp"
#include "modgraph/graph/graph_types.hpp"
#include "modgraph/graph/node_arena.hpp"

#include <redlog.hpp>

namespace modgraph
{

/**
 * @brief A directed graph of identifier-keyed nodes with optional edge attributes.
 *
 * @details
 * `DependencyGraph` records one node per module (or other unit) and one edge per
 * dependency relationship between two nodes. The graph never constructs nodes; the
 * caller owns them through `std::shared_ptr<Node>` and the graph shares that ownership.
 *
 * @tparam Node Node type. Its identifier is read through `Identity`, by default
 *         `node.identifier()`. Identifiers are unique within a graph.
 * @tparam EdgeAttr Value stored on each edge. `std::monostate` for bare edges.
 * @tparam Identity Policy type providing `static std::string identifier(const Node&)`.
 *
 * @par Data model
 * - **Nodes**: keyed by identifier, stored densely in insertion order (`NodeArena`).
 * - **Roots**: a subset of nodes marking traversal entry points.
 * - **Edges**: at most one per ordered (source, destination) pair, stored in an ordered
 *   map keyed by node indices. A second relationship between the same pair is recorded
 *   by merging attributes. Self-loops are ordinary edges.
 * - Nothing is ever removed: nodes, roots and edges persist for the graph's lifetime.
 *
 * @par Node references
 * Every operation that takes a node also accepts its identifier. A node pointer is
 * resolved by its identifier, so any node object with the same identifier refers to the
 * stored node. A null pointer never stands for a node: the mutating, `edge_data()` and
 * `iter_graph()` overloads throw `InvalidArgument` for it, while `find_node()`,
 * `contains()`, `outgoing()` and `incoming()` treat it as absent.
 *
 * @par Lazy ranges
 * `roots()`, `edges()`, `outgoing()`, `incoming()` and `iter_graph()` return lightweight
 * range objects that read the graph as they are iterated. Each call yields a fresh,
 * restartable traversal. Mutating the graph while a range is being iterated is undefined
 * behavior.
 *
 * @par Permissive neighbor queries
 * `outgoing()` and `incoming()` yield an empty range for a node that is not in the
 * graph, so "no such node" and "no edges" look the same. New call sites that need to
 * tell them apart should check `contains()` first.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads (const methods and iteration) are safe if no concurrent writes
 *   occur. Build the graph from a single writer before sharing it.
 */
template <typename Node, typename EdgeAttr = std::monostate,
          typename Identity = NodeIdentity<Node>>
class DependencyGraph
{
public:
    using NodePtr = std::shared_ptr<Node>;
    using MergeFn = std::function<EdgeAttr(const EdgeAttr&, const EdgeAttr&)>;

    /**
     * @brief One edge, as yielded by `edges()`.
     */
    struct Edge
    {
        const NodePtr& source;
        const NodePtr& destination;
        const EdgeAttr& attribute;
    };

    /**
     * @brief One adjacent node, as yielded by `outgoing()` and `incoming()`.
     */
    struct Neighbor
    {
        const EdgeAttr& attribute;
        const NodePtr& node;
    };

    // -------------------------------------------------------------------------
    // Ranges
    // -------------------------------------------------------------------------

    /**
     * @brief Range over the roots, in the order they were first marked.
     */
    class RootRange
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = NodePtr;
            using difference_type = std::ptrdiff_t;
            using pointer = const NodePtr*;
            using reference = const NodePtr&;

            iterator() = default;
            iterator(const DependencyGraph* graph, const NodeIdx* pos)
                : m_graph(graph)
                , m_pos(pos)
            {
            }

            reference operator*() const
            {
                return m_graph->m_nodes.at(*m_pos);
            }

            iterator& operator++()
            {
                ++m_pos;
                return *this;
            }

            bool operator==(const iterator& other) const noexcept
            {
                return m_pos == other.m_pos;
            }

            bool operator!=(const iterator& other) const noexcept
            {
                return !(*this == other);
            }

        private:
            const DependencyGraph* m_graph = nullptr;
            const NodeIdx* m_pos = nullptr;
        };

        explicit RootRange(const DependencyGraph* graph)
            : m_graph(graph)
        {
        }

        iterator begin() const
        {
            return iterator(m_graph, m_graph->m_root_order.data());
        }

        iterator end() const
        {
            return iterator(m_graph, m_graph->m_root_order.data() + m_graph->m_root_order.size());
        }

    private:
        const DependencyGraph* m_graph;
    };

    /**
     * @brief Range over all edges, ordered by (source index, destination index).
     */
    class EdgeRange
    {
    public:
        class iterator
        {
        public:
            using map_iterator = typename std::map<EdgeKey, EdgeAttr>::const_iterator;
            using iterator_category = std::input_iterator_tag;
            using value_type = Edge;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = Edge;

            iterator() = default;
            iterator(const DependencyGraph* graph, map_iterator pos)
                : m_graph(graph)
                , m_pos(pos)
            {
            }

            Edge operator*() const
            {
                return Edge{m_graph->m_nodes.at(m_pos->first.first),
                            m_graph->m_nodes.at(m_pos->first.second), m_pos->second};
            }

            iterator& operator++()
            {
                ++m_pos;
                return *this;
            }

            bool operator==(const iterator& other) const noexcept
            {
                return m_pos == other.m_pos;
            }

            bool operator!=(const iterator& other) const noexcept
            {
                return !(*this == other);
            }

        private:
            const DependencyGraph* m_graph = nullptr;
            map_iterator m_pos{};
        };

        explicit EdgeRange(const DependencyGraph* graph)
            : m_graph(graph)
        {
        }

        iterator begin() const
        {
            return iterator(m_graph, m_graph->m_edges.cbegin());
        }

        iterator end() const
        {
            return iterator(m_graph, m_graph->m_edges.cend());
        }

    private:
        const DependencyGraph* m_graph;
    };

    /**
     * @brief Range over the edges leaving or entering one node, in edge insertion order.
     */
    class NeighborRange
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Neighbor;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = Neighbor;

            iterator() = default;
            iterator(const DependencyGraph* graph, NodeIdx anchor, bool outgoing,
                     const NodeIdx* pos)
                : m_graph(graph)
                , m_anchor(anchor)
                , m_outgoing(outgoing)
                , m_pos(pos)
            {
            }

            Neighbor operator*() const
            {
                EdgeKey key = m_outgoing ? EdgeKey{m_anchor, *m_pos} : EdgeKey{*m_pos, m_anchor};
                return Neighbor{m_graph->m_edges.at(key), m_graph->m_nodes.at(*m_pos)};
            }

            iterator& operator++()
            {
                ++m_pos;
                return *this;
            }

            bool operator==(const iterator& other) const noexcept
            {
                return m_pos == other.m_pos;
            }

            bool operator!=(const iterator& other) const noexcept
            {
                return !(*this == other);
            }

        private:
            const DependencyGraph* m_graph = nullptr;
            NodeIdx m_anchor = 0;
            bool m_outgoing = true;
            const NodeIdx* m_pos = nullptr;
        };

        /// Empty range.
        NeighborRange() = default;

        NeighborRange(const DependencyGraph* graph, NodeIdx anchor, bool outgoing)
            : m_graph(graph)
            , m_anchor(anchor)
            , m_outgoing(outgoing)
            , m_list(outgoing ? &graph->m_successors[anchor] : &graph->m_predecessors[anchor])
        {
        }

        iterator begin() const
        {
            return iterator(m_graph, m_anchor, m_outgoing, m_list ? m_list->data() : nullptr);
        }

        iterator end() const
        {
            return iterator(m_graph, m_anchor, m_outgoing,
                            m_list ? m_list->data() + m_list->size() : nullptr);
        }

        bool empty() const noexcept
        {
            return !m_list || m_list->empty();
        }

    private:
        const DependencyGraph* m_graph = nullptr;
        NodeIdx m_anchor = 0;
        bool m_outgoing = true;
        const std::vector<NodeIdx>* m_list = nullptr;
    };

    /**
     * @brief Depth-first reachability range.
     *
     * @details
     * Yields every node reachable from the start nodes exactly once, each node after
     * the node through which it was first discovered. Start nodes are walked in order,
     * sharing one visited set. The traversal keeps an explicit stack, so cycles and deep
     * chains are safe.
     */
    class ReachableRange
    {
    public:
        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = NodePtr;
            using difference_type = std::ptrdiff_t;
            using pointer = const NodePtr*;
            using reference = const NodePtr&;

            /// End iterator.
            iterator() = default;

            iterator(const DependencyGraph* graph, const std::vector<NodeIdx>& starts);

            reference operator*() const
            {
                return m_graph->m_nodes.at(m_state->current);
            }

            iterator& operator++()
            {
                advance();
                return *this;
            }

            bool operator==(const iterator& other) const noexcept
            {
                return m_state == other.m_state;
            }

            bool operator!=(const iterator& other) const noexcept
            {
                return !(*this == other);
            }

        private:
            struct State
            {
                std::vector<NodeIdx> starts;
                std::size_t next_start = 0;
                std::vector<NodeIdx> stack;
                std::vector<bool> visited;
                NodeIdx current = 0;
            };

            void advance();

            const DependencyGraph* m_graph = nullptr;
            std::shared_ptr<State> m_state;
        };

        ReachableRange(const DependencyGraph* graph, std::vector<NodeIdx> starts)
            : m_graph(graph)
            , m_starts(std::move(starts))
        {
        }

        iterator begin() const
        {
            return iterator(m_graph, m_starts);
        }

        iterator end() const
        {
            return iterator();
        }

    private:
        const DependencyGraph* m_graph;
        std::vector<NodeIdx> m_starts;
    };

public:
    DependencyGraph() = default;

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------

    /**
     * @brief Add a node.
     * @throw DependencyGraphError with `InvalidArgument` if `node` is null, or
     *        `DuplicateNode` if a node with the same identifier exists.
     */
    void add_node(const NodePtr& node);

    /**
     * @brief Mark an existing node as a root. Marking a root again is a no-op.
     * @throw DependencyGraphError with `NodeNotFound` if the node is absent, or
     *        `InvalidArgument` for a null node pointer.
     */
    void add_root(const std::string& identifier);
    void add_root(const NodePtr& node);

    /**
     * @brief Add a directed edge, or merge into the existing one.
     * @param source Source node or identifier.
     * @param destination Destination node or identifier.
     * @param attribute Value to store on the edge.
     * @param merge If the edge already exists and `merge` is set, the stored attribute
     *        becomes `merge(existing, attribute)`.
     * @throw DependencyGraphError with `NodeNotFound` if either endpoint is absent, or
     *        `DuplicateEdge` if the edge exists and no `merge` is given, or
     *        `InvalidArgument` if an endpoint is a null node pointer.
     * @note If `merge` throws, the edge keeps its previous attribute.
     */
    void add_edge(const std::string& source, const std::string& destination,
                  EdgeAttr attribute = EdgeAttr{}, const MergeFn& merge = MergeFn{});
    void add_edge(const NodePtr& source, const NodePtr& destination,
                  EdgeAttr attribute = EdgeAttr{}, const MergeFn& merge = MergeFn{});

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    /**
     * @brief Find a node. Never throws for an absent node.
     * @return The stored node, or null if absent.
     */
    NodePtr find_node(const std::string& identifier) const;
    NodePtr find_node(const NodePtr& node) const;

    bool contains(const std::string& identifier) const;
    bool contains(const NodePtr& node) const;

    /**
     * @brief Get the attribute of an edge.
     * @throw DependencyGraphError with `NodeNotFound` if either endpoint is absent, or
     *        `NoSuchEdge` if there is no edge between them, or `InvalidArgument` if an
     *        endpoint is a null node pointer.
     */
    const EdgeAttr& edge_data(const std::string& source, const std::string& destination) const;
    const EdgeAttr& edge_data(const NodePtr& source, const NodePtr& destination) const;

    bool has_edge(const std::string& source, const std::string& destination) const;

    std::size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    std::size_t root_count() const noexcept
    {
        return m_root_order.size();
    }

    std::size_t edge_count() const noexcept
    {
        return m_edges.size();
    }

    // -------------------------------------------------------------------------
    // Iteration
    // -------------------------------------------------------------------------

    RootRange roots() const
    {
        return RootRange(this);
    }

    /**
     * @brief All nodes, in insertion order.
     */
    const std::vector<NodePtr>& nodes() const noexcept
    {
        return m_nodes.nodes();
    }

    EdgeRange edges() const
    {
        return EdgeRange(this);
    }

    /**
     * @brief (attribute, destination) for every edge leaving `source`.
     * @note Empty, not an error, if `source` is absent.
     */
    NeighborRange outgoing(const std::string& source) const;
    NeighborRange outgoing(const NodePtr& source) const;

    /**
     * @brief (attribute, source) for every edge entering `destination`.
     * @note Empty, not an error, if `destination` is absent.
     */
    NeighborRange incoming(const std::string& destination) const;
    NeighborRange incoming(const NodePtr& destination) const;

    /**
     * @brief Nodes reachable from the roots, each yielded once.
     */
    ReachableRange iter_graph() const;

    /**
     * @brief Nodes reachable from `start` (inclusive), each yielded once.
     * @throw DependencyGraphError with `NodeNotFound` if `start` is absent, or
     *        `InvalidArgument` if it is a null node pointer.
     */
    ReachableRange iter_graph(const std::string& start) const;
    ReachableRange iter_graph(const NodePtr& start) const;

    /**
     * @brief Summary such as `<DependencyGraph with 1 roots, 3 nodes and 2 edges>`.
     */
    std::string describe() const;

private:
    /// Index of the node with this identifier, or throw NodeNotFound.
    NodeIdx require_node(const std::string& identifier, const char* role) const;

    /// Identifier of a node pointer, or throw InvalidArgument for a null pointer.
    static std::string identifier_of(const NodePtr& node, const char* role);

    void add_edge_impl(NodeIdx source, NodeIdx destination, EdgeAttr attribute,
                       const MergeFn& merge);

private:
    NodeArena<Node, Identity> m_nodes;

    /// Root flags, indexed by node index.
    std::vector<bool> m_is_root;

    /// Root indices in the order they were first marked.
    std::vector<NodeIdx> m_root_order;

    /// Edge attributes keyed by (source, destination).
    std::map<EdgeKey, EdgeAttr> m_edges;

    /// Destinations of outgoing edges, indexed by source, in edge insertion order.
    std::vector<std::vector<NodeIdx>> m_successors;

    /// Sources of incoming edges, indexed by destination, in edge insertion order.
    std::vector<std::vector<NodeIdx>> m_predecessors;

    redlog::logger m_log = redlog::get_logger("modgraph.graph");
};

template <typename Node, typename EdgeAttr, typename Identity>
std::ostream& operator<<(std::ostream& os, const DependencyGraph<Node, EdgeAttr, Identity>& graph)
{
    return os << graph.describe();
}

} // namespace modgraph
