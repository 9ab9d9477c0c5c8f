#ifndef HGRAPH_STORAGE_GRAPH_H_
#define HGRAPH_STORAGE_GRAPH_H_

#include <map>
#include <optional>
#include <vector>

#include "hgraph/core/types.h"

namespace hgraph {
namespace storage {

/**
 * @brief In-memory directed graph snapshot
 *
 * Keeps forward and reverse adjacency in ordered maps so that every
 * traversal visits vertices and neighbors in ascending id order. Searches
 * rely on that ordering for deterministic results.
 *
 * Invariants:
 * - every edge endpoint is a vertex of the graph
 * - at most one edge per ordered (from, to) pair
 * - reverse adjacency mirrors forward adjacency exactly
 */
class Graph {
public:
    using Adjacency = std::map<core::VertexId, core::Weight>;

    Graph() = default;

    /// No-op if the vertex already exists.
    void add_vertex(core::VertexId id);

    /// Creates missing endpoints; replaces the weight of an existing edge.
    void add_edge(core::VertexId from, core::VertexId to, core::Weight weight = core::kDefaultWeight);

    /// Removes the vertex and every incident edge. Returns false if absent.
    bool remove_vertex(core::VertexId id);

    /// Returns false if the edge was absent.
    bool remove_edge(core::VertexId from, core::VertexId to);

    bool has_vertex(core::VertexId id) const;
    bool has_edge(core::VertexId from, core::VertexId to) const;
    std::optional<core::Weight> edge_weight(core::VertexId from, core::VertexId to) const;

    /// Outgoing neighbors in ascending id order. Empty for unknown vertices.
    const Adjacency& successors(core::VertexId id) const;

    /// Incoming neighbors in ascending id order. Empty for unknown vertices.
    const Adjacency& predecessors(core::VertexId id) const;

    size_t out_degree(core::VertexId id) const { return successors(id).size(); }
    size_t in_degree(core::VertexId id) const { return predecessors(id).size(); }

    size_t vertex_count() const { return forward_.size(); }
    size_t edge_count() const { return edge_count_; }
    bool empty() const { return forward_.empty(); }

    /// All vertex ids, ascending.
    std::vector<core::VertexId> vertices() const;

    /// All edges ordered by (from, to).
    std::vector<core::EdgeKey> edges() const;

    std::optional<core::VertexId> min_vertex() const;
    std::optional<core::VertexId> max_vertex() const;

    /// Smallest edge weight, or nullopt for an edgeless graph.
    std::optional<core::Weight> min_edge_weight() const;
    std::optional<core::Weight> max_edge_weight() const;

    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    std::map<core::VertexId, Adjacency> forward_;
    std::map<core::VertexId, Adjacency> reverse_;
    size_t edge_count_ = 0;
};

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_GRAPH_H_
