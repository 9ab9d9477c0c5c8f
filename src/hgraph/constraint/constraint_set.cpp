#include "hgraph/constraint/constraint_set.h"

#include <algorithm>
#include <sstream>

#include "hgraph/common/logger.h"

namespace hgraph {
namespace constraint {

namespace {

core::Result<void> invalid(const std::string& message) {
    HGRAPH_DEBUG("Constraint validation failed: {}", message);
    return core::Result<void>::error(core::Error::Code::INVALID_CONSTRAINT, message);
}

std::string edge_str(const core::EdgeKey& edge) {
    return "(" + std::to_string(edge.first) + ", " + std::to_string(edge.second) + ")";
}

template<typename T>
std::string opt_str(const std::optional<T>& value) {
    return value ? std::to_string(*value) : std::string("-");
}

core::Result<void> check_bounds(const ConstraintSet& cs) {
    if (cs.min_length && cs.max_length && *cs.min_length > *cs.max_length) {
        return invalid("Incompatible set of min/max length constraints: min=" +
                       std::to_string(*cs.min_length) + ", max=" + std::to_string(*cs.max_length));
    }
    if (cs.exact_length &&
        ((cs.min_length && *cs.exact_length < *cs.min_length) ||
         (cs.max_length && *cs.exact_length > *cs.max_length))) {
        return invalid("Exact length " + std::to_string(*cs.exact_length) +
                       " is outside of the min/max length range [" + opt_str(cs.min_length) +
                       ", " + opt_str(cs.max_length) + "]");
    }
    if (cs.min_score && cs.max_score && *cs.min_score > *cs.max_score) {
        return invalid("Incompatible set of min/max score constraints: min=" +
                       std::to_string(*cs.min_score) + ", max=" + std::to_string(*cs.max_score));
    }
    if (cs.exact_score &&
        ((cs.min_score && *cs.exact_score < *cs.min_score) ||
         (cs.max_score && *cs.exact_score > *cs.max_score))) {
        return invalid("Exact score " + std::to_string(*cs.exact_score) +
                       " is outside of the min/max score range [" + opt_str(cs.min_score) +
                       ", " + opt_str(cs.max_score) + "]");
    }
    return core::Result<void>();
}

core::Result<void> check_edge_sets(const ConstraintSet& cs, const storage::Graph& graph) {
    for (const auto& edge : cs.include_edges) {
        if (cs.exclude_edges.count(edge)) {
            return invalid("Edge " + edge_str(edge) + " is included and excluded at the same time");
        }
        if (cs.excludes(edge.first) || cs.excludes(edge.second)) {
            return invalid("Edge " + edge_str(edge) + " is included but one of its endpoints is excluded");
        }
        if (!graph.has_edge(edge.first, edge.second)) {
            return invalid("Included edge " + edge_str(edge) + " is not in the graph");
        }
    }
    return core::Result<void>();
}

core::Result<void> check_included_vertices(const ConstraintSet& cs, const storage::Graph& graph) {
    for (auto id : cs.include_vertices) {
        if (cs.excludes(id)) {
            return invalid("Vertex " + std::to_string(id) + " is included and excluded at the same time");
        }
        if (!graph.has_vertex(id)) {
            return invalid("Included vertex " + std::to_string(id) + " is not in the graph");
        }
    }
    return core::Result<void>();
}

core::Result<void> check_mandatory_fits(const ConstraintSet& cs, size_t mandatory) {
    auto ceiling = cs.length_ceiling();
    if (ceiling && *ceiling < mandatory) {
        return invalid("Length bound " + std::to_string(*ceiling) + " is smaller than the " +
                       std::to_string(mandatory) + " mandatory vertices");
    }
    return core::Result<void>();
}

} // namespace

bool ConstraintSet::empty() const {
    return include_vertices.empty() && exclude_vertices.empty() && include_edges.empty() &&
           exclude_edges.empty() && ordered_vertices.empty() && !exact_length && !min_length &&
           !max_length && !exact_score && !min_score && !max_score && !require_cycle && !forbid_cycle;
}

std::optional<size_t> ConstraintSet::length_floor() const {
    if (exact_length) {
        return exact_length;
    }
    return min_length;
}

std::optional<size_t> ConstraintSet::length_ceiling() const {
    if (exact_length) {
        return exact_length;
    }
    return max_length;
}

std::optional<core::Score> ConstraintSet::score_floor() const {
    if (exact_score) {
        return exact_score;
    }
    return min_score;
}

std::optional<core::Score> ConstraintSet::score_ceiling() const {
    if (exact_score) {
        return exact_score;
    }
    return max_score;
}

std::string ConstraintSet::describe() const {
    std::ostringstream oss;
    oss << "include=" << include_vertices.size() << " exclude=" << exclude_vertices.size()
        << " include_edges=" << include_edges.size() << " exclude_edges=" << exclude_edges.size()
        << " ordered=" << ordered_vertices.size()
        << " length=[" << opt_str(length_floor()) << ", " << opt_str(length_ceiling()) << "]"
        << " score=[" << opt_str(score_floor()) << ", " << opt_str(score_ceiling()) << "]";
    if (require_cycle) oss << " require_cycle";
    if (forbid_cycle) oss << " forbid_cycle";
    return oss.str();
}

core::Result<void> validate_path_constraints(const ConstraintSet& cs,
                                             const storage::Graph& graph,
                                             core::VertexId start,
                                             core::VertexId end) {
    auto bounds = check_bounds(cs);
    if (!bounds.ok()) {
        return bounds;
    }
    if (cs.require_cycle && cs.forbid_cycle) {
        return invalid("Incompatible set of constraints about cycle inclusion and exclusion");
    }
    if (!cs.include_edges.empty()) {
        return invalid("Edge inclusion is only supported for cycle queries");
    }

    for (auto endpoint : {start, end}) {
        if (!graph.has_vertex(endpoint)) {
            return invalid("Vertex " + std::to_string(endpoint) + " is not in the graph");
        }
        if (cs.excludes(endpoint)) {
            return invalid("Path endpoint " + std::to_string(endpoint) + " is excluded");
        }
    }

    auto included = check_included_vertices(cs, graph);
    if (!included.ok()) {
        return included;
    }

    std::set<core::VertexId> ordered;
    for (auto id : cs.ordered_vertices) {
        if (!ordered.insert(id).second) {
            return invalid("Vertex " + std::to_string(id) + " appears twice in the ordered vertices");
        }
        if (cs.excludes(id)) {
            return invalid("Ordered vertex " + std::to_string(id) + " is excluded");
        }
        if (!graph.has_vertex(id)) {
            return invalid("Ordered vertex " + std::to_string(id) + " is not in the graph");
        }
    }
    if (!ordered.empty() && !cs.include_vertices.empty() &&
        std::none_of(ordered.begin(), ordered.end(),
                     [&cs](core::VertexId id) { return cs.include_vertices.count(id) > 0; })) {
        return invalid("Ordered vertices and included vertices are disjoint");
    }

    std::set<core::VertexId> mandatory(cs.include_vertices.begin(), cs.include_vertices.end());
    mandatory.insert(ordered.begin(), ordered.end());
    mandatory.insert(start);
    mandatory.insert(end);
    return check_mandatory_fits(cs, mandatory.size());
}

core::Result<void> validate_cycle_constraints(const ConstraintSet& cs, const storage::Graph& graph) {
    auto bounds = check_bounds(cs);
    if (!bounds.ok()) {
        return bounds;
    }
    if (!cs.ordered_vertices.empty()) {
        return invalid("Ordered vertices are only supported for path queries");
    }
    if (cs.require_cycle || cs.forbid_cycle) {
        return invalid("Cycle presence constraints are only supported for path queries");
    }

    auto included = check_included_vertices(cs, graph);
    if (!included.ok()) {
        return included;
    }
    auto edges = check_edge_sets(cs, graph);
    if (!edges.ok()) {
        return edges;
    }

    std::set<core::VertexId> mandatory(cs.include_vertices.begin(), cs.include_vertices.end());
    for (const auto& edge : cs.include_edges) {
        mandatory.insert(edge.first);
        mandatory.insert(edge.second);
    }
    return check_mandatory_fits(cs, mandatory.size());
}

} // namespace constraint
} // namespace hgraph
