#include "hgraph/storage/graph_store.h"

#include "hgraph/common/logger.h"
#include "hgraph/storage/materializer.h"

namespace hgraph {
namespace storage {

GraphStore::GraphStore(core::StoreConfig config) : log_(std::move(config)) {}

core::Result<void> GraphStore::init() {
    return log_.init();
}

core::Result<void> GraphStore::validate(const core::Command& command) {
    if (command.a == core::kInvalidVertex ||
        (command.is_edge_command() && command.b == core::kInvalidVertex)) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Vertex ids must be positive integers");
    }
    if (command.type == core::CommandType::ADD_EDGE && command.weight == 0) {
        return core::Result<void>::error(core::Error::Code::INVALID_ARGUMENT,
                                         "Edge weights must be positive integers");
    }
    return core::Result<void>();
}

core::Result<void> GraphStore::append(const std::vector<core::Command>& commands) {
    for (const auto& cmd : commands) {
        auto valid = validate(cmd);
        if (!valid.ok()) {
            return valid;
        }
    }
    return log_.append(commands);
}

core::Result<void> GraphStore::add_vertices(const std::vector<core::VertexId>& ids) {
    std::vector<core::Command> commands;
    commands.reserve(ids.size());
    for (auto id : ids) {
        commands.push_back(core::Command::AddVertex(id));
    }
    return append(commands);
}

core::Result<void> GraphStore::add_edges(const std::vector<core::EdgeKey>& edges, core::Weight weight) {
    std::vector<core::Command> commands;
    commands.reserve(edges.size());
    for (const auto& [from, to] : edges) {
        commands.push_back(core::Command::AddEdge(from, to, weight));
    }
    return append(commands);
}

core::Result<void> GraphStore::remove_vertices(const std::vector<core::VertexId>& ids) {
    std::vector<core::Command> commands;
    commands.reserve(ids.size());
    for (auto id : ids) {
        commands.push_back(core::Command::RemoveVertex(id));
    }
    return append(commands);
}

core::Result<void> GraphStore::remove_edges(const std::vector<core::EdgeKey>& edges) {
    std::vector<core::Command> commands;
    commands.reserve(edges.size());
    for (const auto& [from, to] : edges) {
        commands.push_back(core::Command::RemoveEdge(from, to));
    }
    return append(commands);
}

core::Result<Graph> GraphStore::build() const {
    auto commands = log_.load();
    if (!commands.ok()) {
        return core::Result<Graph>::propagate(commands);
    }
    return core::Result<Graph>(Materializer::build(commands.value()));
}

core::Result<Graph> GraphStore::compact() {
    Graph compacted;
    auto result = log_.rewrite([&compacted](const std::vector<core::Command>& current) {
        compacted = Materializer::build(current);
        return core::Result<std::vector<core::Command>>(Materializer::to_commands(compacted));
    });
    if (!result.ok()) {
        return core::Result<Graph>::propagate(result);
    }
    return core::Result<Graph>(std::move(compacted));
}

core::Result<void> GraphStore::clean() {
    return log_.destroy();
}

} // namespace storage
} // namespace hgraph
