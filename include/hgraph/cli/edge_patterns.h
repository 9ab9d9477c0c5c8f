#ifndef HGRAPH_CLI_EDGE_PATTERNS_H_
#define HGRAPH_CLI_EDGE_PATTERNS_H_

#include <vector>

#include "hgraph/core/result.h"
#include "hgraph/core/types.h"

namespace hgraph {
namespace cli {

/// v0->v1, v1->v2, ... Needs at least two vertices.
core::Result<std::vector<core::EdgeKey>> chain_edges(const std::vector<core::VertexId>& vertices);

/// The chain closed by vN->v0. A single vertex yields a self-loop.
core::Result<std::vector<core::EdgeKey>> cycle_edges(const std::vector<core::VertexId>& vertices);

/// v0->vi for every other vertex. Needs at least two vertices.
core::Result<std::vector<core::EdgeKey>> star_edges(const std::vector<core::VertexId>& vertices);

/// vi->vj for every ordered pair of distinct vertices. Needs at least two vertices.
core::Result<std::vector<core::EdgeKey>> clique_edges(const std::vector<core::VertexId>& vertices);

/// Swaps the direction of every edge.
std::vector<core::EdgeKey> reversed(std::vector<core::EdgeKey> edges);

} // namespace cli
} // namespace hgraph

#endif // HGRAPH_CLI_EDGE_PATTERNS_H_
