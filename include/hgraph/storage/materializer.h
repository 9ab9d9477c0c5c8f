#ifndef HGRAPH_STORAGE_MATERIALIZER_H_
#define HGRAPH_STORAGE_MATERIALIZER_H_

#include <vector>

#include "hgraph/core/types.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace storage {

/**
 * @brief Replays a command sequence into a Graph snapshot
 *
 * Replay is strictly ordered and deterministic: the same sequence always
 * yields the same graph. Commands that refer to absent vertices or edges
 * are no-ops, except AddEdge which creates its endpoints.
 */
class Materializer {
public:
    static Graph build(const std::vector<core::Command>& commands);

    static void apply(Graph& graph, const core::Command& command);

    /**
     * @brief Minimal command sequence that rebuilds `graph`
     *
     * AddVertex for every vertex ascending, then AddEdge for every edge
     * ordered by (from, to).
     */
    static std::vector<core::Command> to_commands(const Graph& graph);
};

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_MATERIALIZER_H_
