#ifndef HGRAPH_STORAGE_GRAPH_STORE_H_
#define HGRAPH_STORAGE_GRAPH_STORE_H_

#include <vector>

#include "hgraph/core/config.h"
#include "hgraph/core/result.h"
#include "hgraph/core/types.h"
#include "hgraph/storage/command_log.h"
#include "hgraph/storage/graph.h"

namespace hgraph {
namespace storage {

/**
 * @brief Graph store rooted at one directory
 *
 * Producers append mutations through this facade; consumers call build()
 * to obtain an owned snapshot for the duration of a query. Vertex ids and
 * edge weights are validated before anything reaches the log.
 */
class GraphStore {
public:
    explicit GraphStore(core::StoreConfig config = core::StoreConfig::Default());

    core::Result<void> init();
    bool exists() const { return log_.exists(); }

    core::Result<void> add_vertices(const std::vector<core::VertexId>& ids);
    core::Result<void> add_edges(const std::vector<core::EdgeKey>& edges,
                                 core::Weight weight = core::kDefaultWeight);
    core::Result<void> remove_vertices(const std::vector<core::VertexId>& ids);
    core::Result<void> remove_edges(const std::vector<core::EdgeKey>& edges);

    /// Appends arbitrary commands after validating them.
    core::Result<void> append(const std::vector<core::Command>& commands);

    core::Result<std::vector<core::Command>> load() const { return log_.load(); }

    /// Loads the log and replays it into a fresh snapshot.
    core::Result<Graph> build() const;

    /**
     * @brief Rewrites the log as the minimal sequence for the current graph
     * @return the compacted graph
     */
    core::Result<Graph> compact();

    /// Deletes the store directory. Cannot be undone.
    core::Result<void> clean();

    const core::StoreConfig& config() const { return log_.config(); }

    static core::Result<void> validate(const core::Command& command);

private:
    CommandLog log_;
};

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_GRAPH_STORE_H_
