#include "hgraph/storage/graph.h"

namespace hgraph {
namespace storage {

namespace {
const Graph::Adjacency kNoNeighbors;
}

void Graph::add_vertex(core::VertexId id) {
    forward_.emplace(id, Adjacency());
    reverse_.emplace(id, Adjacency());
}

void Graph::add_edge(core::VertexId from, core::VertexId to, core::Weight weight) {
    add_vertex(from);
    add_vertex(to);
    auto [it, inserted] = forward_[from].insert_or_assign(to, weight);
    (void)it;
    reverse_[to][from] = weight;
    if (inserted) {
        ++edge_count_;
    }
}

bool Graph::remove_vertex(core::VertexId id) {
    auto fwd = forward_.find(id);
    if (fwd == forward_.end()) {
        return false;
    }

    // Incident edges go first, then the vertex itself.
    for (const auto& [to, weight] : fwd->second) {
        (void)weight;
        if (to != id) {
            reverse_[to].erase(id);
        }
        --edge_count_;
    }
    auto rev = reverse_.find(id);
    for (const auto& [from, weight] : rev->second) {
        (void)weight;
        if (from != id) {
            forward_[from].erase(id);
            --edge_count_;
        }
    }

    forward_.erase(fwd);
    reverse_.erase(rev);
    return true;
}

bool Graph::remove_edge(core::VertexId from, core::VertexId to) {
    auto fwd = forward_.find(from);
    if (fwd == forward_.end() || fwd->second.erase(to) == 0) {
        return false;
    }
    reverse_[to].erase(from);
    --edge_count_;
    return true;
}

bool Graph::has_vertex(core::VertexId id) const {
    return forward_.count(id) > 0;
}

bool Graph::has_edge(core::VertexId from, core::VertexId to) const {
    return edge_weight(from, to).has_value();
}

std::optional<core::Weight> Graph::edge_weight(core::VertexId from, core::VertexId to) const {
    auto fwd = forward_.find(from);
    if (fwd == forward_.end()) {
        return std::nullopt;
    }
    auto it = fwd->second.find(to);
    if (it == fwd->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Graph::Adjacency& Graph::successors(core::VertexId id) const {
    auto it = forward_.find(id);
    return it == forward_.end() ? kNoNeighbors : it->second;
}

const Graph::Adjacency& Graph::predecessors(core::VertexId id) const {
    auto it = reverse_.find(id);
    return it == reverse_.end() ? kNoNeighbors : it->second;
}

std::vector<core::VertexId> Graph::vertices() const {
    std::vector<core::VertexId> ids;
    ids.reserve(forward_.size());
    for (const auto& entry : forward_) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<core::EdgeKey> Graph::edges() const {
    std::vector<core::EdgeKey> result;
    result.reserve(edge_count_);
    for (const auto& [from, adjacency] : forward_) {
        for (const auto& entry : adjacency) {
            result.emplace_back(from, entry.first);
        }
    }
    return result;
}

std::optional<core::VertexId> Graph::min_vertex() const {
    if (forward_.empty()) {
        return std::nullopt;
    }
    return forward_.begin()->first;
}

std::optional<core::VertexId> Graph::max_vertex() const {
    if (forward_.empty()) {
        return std::nullopt;
    }
    return forward_.rbegin()->first;
}

std::optional<core::Weight> Graph::min_edge_weight() const {
    std::optional<core::Weight> best;
    for (const auto& entry : forward_) {
        for (const auto& [to, weight] : entry.second) {
            (void)to;
            if (!best || weight < *best) {
                best = weight;
            }
        }
    }
    return best;
}

std::optional<core::Weight> Graph::max_edge_weight() const {
    std::optional<core::Weight> best;
    for (const auto& entry : forward_) {
        for (const auto& [to, weight] : entry.second) {
            (void)to;
            if (!best || weight > *best) {
                best = weight;
            }
        }
    }
    return best;
}

bool Graph::operator==(const Graph& other) const {
    return forward_ == other.forward_;
}

} // namespace storage
} // namespace hgraph
