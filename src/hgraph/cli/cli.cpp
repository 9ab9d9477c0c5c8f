#include "hgraph/cli/cli.h"

#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>

#include "hgraph/algorithm/graph_summary.h"
#include "hgraph/algorithm/topo_sort.h"
#include "hgraph/cli/arguments.h"
#include "hgraph/cli/edge_patterns.h"
#include "hgraph/common/logger.h"
#include "hgraph/config.h"
#include "hgraph/constraint/constraint_set.h"
#include "hgraph/core/config.h"
#include "hgraph/search/constrained_path.h"
#include "hgraph/search/cycle_enumerator.h"
#include "hgraph/storage/command_codec.h"
#include "hgraph/storage/graph_store.h"

namespace hgraph {
namespace cli {

namespace {

struct Invocation {
    const Arguments& args;
    core::StoreConfig store;
    core::SearchConfig search;
    std::ostream& out;
    std::ostream& err;
};

using Handler = std::function<int(Invocation&)>;

struct CommandSpec {
    std::set<std::string> options;
    Handler handler;
    const char* summary;
};

int usage_error(std::ostream& err, const std::string& message) {
    err << "error: " << message << std::endl;
    err << "Use --help for usage information" << std::endl;
    return kExitUsage;
}

template<typename T>
int report(std::ostream& err, const core::Result<T>& failed) {
    if (failed.code() == core::Error::Code::INVALID_ARGUMENT) {
        return usage_error(err, failed.error());
    }
    err << "error: " << core::code_name(failed.code()) << ": " << failed.error() << std::endl;
    return core::exit_code_for(failed.code());
}

const std::set<std::string> kConstraintOptions = {
    "include", "exclude", "include-edges", "exclude-edges",
    "min-length", "max-length", "exact-length",
    "min-score", "max-score", "exact-score",
};

core::Result<constraint::ConstraintSet> read_constraints(const Arguments& args) {
    using Out = core::Result<constraint::ConstraintSet>;
    constraint::ConstraintSet cs;

    auto include = args.vertex_ids("include");
    if (!include.ok()) return Out::propagate(include);
    cs.include_vertices.insert(include.value().begin(), include.value().end());

    auto exclude = args.vertex_ids("exclude");
    if (!exclude.ok()) return Out::propagate(exclude);
    cs.exclude_vertices.insert(exclude.value().begin(), exclude.value().end());

    auto include_edges = args.edge_pairs("include-edges");
    if (!include_edges.ok()) return Out::propagate(include_edges);
    cs.include_edges.insert(include_edges.value().begin(), include_edges.value().end());

    auto exclude_edges = args.edge_pairs("exclude-edges");
    if (!exclude_edges.ok()) return Out::propagate(exclude_edges);
    cs.exclude_edges.insert(exclude_edges.value().begin(), exclude_edges.value().end());

    auto ordered = args.vertex_ids("ordered");
    if (!ordered.ok()) return Out::propagate(ordered);
    cs.ordered_vertices = ordered.value();

    for (const auto& [flag, target] : {std::make_pair("min-length", &cs.min_length),
                                       std::make_pair("max-length", &cs.max_length),
                                       std::make_pair("exact-length", &cs.exact_length)}) {
        auto value = args.unsigned_value(flag);
        if (!value.ok()) return Out::propagate(value);
        if (value.value()) {
            *target = static_cast<size_t>(*value.value());
        }
    }
    for (const auto& [flag, target] : {std::make_pair("min-score", &cs.min_score),
                                       std::make_pair("max-score", &cs.max_score),
                                       std::make_pair("exact-score", &cs.exact_score)}) {
        auto value = args.signed_value(flag);
        if (!value.ok()) return Out::propagate(value);
        if (value.value()) {
            *target = *value.value();
        }
    }

    for (const char* flag : {"include-cycle", "no-cycle"}) {
        auto plain = args.expect_switch(flag);
        if (!plain.ok()) return Out::propagate(plain);
    }
    cs.require_cycle = args.has("include-cycle");
    cs.forbid_cycle = args.has("no-cycle");
    return Out(std::move(cs));
}

core::Result<storage::Graph> load_graph(const Invocation& inv) {
    storage::GraphStore store(inv.store);
    return store.build();
}

int cmd_init(Invocation& inv) {
    storage::GraphStore store(inv.store);
    auto result = store.init();
    if (!result.ok()) return report(inv.err, result);
    inv.out << "Initialized empty graph in " << inv.store.store_dir() << std::endl;
    return kExitOk;
}

int cmd_add(Invocation& inv) {
    const Arguments& args = inv.args;
    auto weight = args.unsigned_value("weight");
    if (!weight.ok()) return report(inv.err, weight);
    if (weight.value() && *weight.value() != core::kDefaultWeight) {
        inv.err << "error: " << core::code_name(core::Error::Code::UNSUPPORTED)
                << ": edge weights other than " << core::kDefaultWeight << " are not supported" << std::endl;
        return core::exit_code_for(core::Error::Code::UNSUPPORTED);
    }
    auto reverse = args.expect_switch("reverse");
    if (!reverse.ok()) return report(inv.err, reverse);

    std::vector<core::Command> batch;
    auto vertices = args.vertex_ids("vertex");
    if (!vertices.ok()) return report(inv.err, vertices);
    for (auto id : vertices.value()) {
        batch.push_back(core::Command::AddVertex(id));
    }

    std::vector<core::EdgeKey> edges;
    auto pairs = args.edge_pairs("edge");
    if (!pairs.ok()) return report(inv.err, pairs);
    edges = pairs.value();

    using Pattern = std::function<core::Result<std::vector<core::EdgeKey>>(const std::vector<core::VertexId>&)>;
    const std::vector<std::pair<std::string, Pattern>> patterns = {
        {"chain", chain_edges}, {"cycle", cycle_edges}, {"star", star_edges}, {"clique", clique_edges}};
    for (const auto& [flag, pattern] : patterns) {
        if (!args.has(flag)) continue;
        auto ids = args.vertex_ids(flag);
        if (!ids.ok()) return report(inv.err, ids);
        auto generated = pattern(ids.value());
        if (!generated.ok()) return report(inv.err, generated);
        edges.insert(edges.end(), generated.value().begin(), generated.value().end());
    }
    if (args.has("reverse")) {
        edges = reversed(std::move(edges));
    }
    for (const auto& [from, to] : edges) {
        batch.push_back(core::Command::AddEdge(from, to));
    }

    if (batch.empty()) {
        return usage_error(inv.err, "Nothing to add: use --vertex, --edge, --chain, --cycle, --star or --clique");
    }
    storage::GraphStore store(inv.store);
    auto result = store.append(batch);
    if (!result.ok()) return report(inv.err, result);
    return kExitOk;
}

int cmd_delete(Invocation& inv) {
    std::vector<core::Command> batch;
    auto edges = inv.args.edge_pairs("edge");
    if (!edges.ok()) return report(inv.err, edges);
    for (const auto& [from, to] : edges.value()) {
        batch.push_back(core::Command::RemoveEdge(from, to));
    }
    auto vertices = inv.args.vertex_ids("vertex");
    if (!vertices.ok()) return report(inv.err, vertices);
    for (auto id : vertices.value()) {
        batch.push_back(core::Command::RemoveVertex(id));
    }

    if (batch.empty()) {
        return usage_error(inv.err, "Nothing to delete: use --vertex or --edge");
    }
    storage::GraphStore store(inv.store);
    auto result = store.append(batch);
    if (!result.ok()) return report(inv.err, result);
    return kExitOk;
}

int cmd_build(Invocation& inv) {
    storage::GraphStore store(inv.store);
    auto graph = store.compact();
    if (!graph.ok()) return report(inv.err, graph);
    inv.out << "Vertices: " << graph.value().vertex_count() << std::endl;
    inv.out << "Edges: " << graph.value().edge_count() << std::endl;
    return kExitOk;
}

int cmd_clean(Invocation& inv) {
    storage::GraphStore store(inv.store);
    auto result = store.clean();
    if (!result.ok()) return report(inv.err, result);
    inv.out << "Removed " << inv.store.store_dir() << std::endl;
    return kExitOk;
}

int cmd_log(Invocation& inv) {
    storage::GraphStore store(inv.store);
    auto commands = store.load();
    if (!commands.ok()) return report(inv.err, commands);
    inv.out << storage::format_commands(commands.value());
    return kExitOk;
}

int cmd_import(Invocation& inv) {
    auto file = inv.args.string_value("file");
    if (!file.ok()) return report(inv.err, file);
    if (!file.value()) {
        return usage_error(inv.err, "import requires --file");
    }

    std::ifstream input(*file.value());
    if (!input.is_open()) {
        inv.err << "error: " << core::code_name(core::Error::Code::IO_ERROR)
                << ": cannot open " << *file.value() << std::endl;
        return core::exit_code_for(core::Error::Code::IO_ERROR);
    }
    std::stringstream text;
    text << input.rdbuf();

    auto commands = storage::parse_commands(text.str());
    if (!commands.ok()) return report(inv.err, commands);

    storage::GraphStore store(inv.store);
    auto result = store.append(commands.value());
    if (!result.ok()) return report(inv.err, result);
    inv.out << "Imported " << commands.value().size() << " command(s)" << std::endl;
    return kExitOk;
}

int cmd_desc(Invocation& inv) {
    auto graph = load_graph(inv);
    if (!graph.ok()) return report(inv.err, graph);
    inv.out << "Path: " << inv.store.root_dir << std::endl;
    inv.out << algorithm::format_summary(algorithm::summarize(graph.value()));
    return kExitOk;
}

int cmd_topo_sort(Invocation& inv) {
    auto graph = load_graph(inv);
    if (!graph.ok()) return report(inv.err, graph);
    auto order = algorithm::topological_sort(graph.value());
    if (!order) {
        inv.out << "Graph is not a DAG." << std::endl;
        return kExitNotFound;
    }
    inv.out << "Topological order:";
    for (auto v : *order) {
        inv.out << " " << v;
    }
    inv.out << std::endl;
    return kExitOk;
}

int cmd_csp(Invocation& inv) {
    auto start = inv.args.vertex_ids("start");
    if (!start.ok()) return report(inv.err, start);
    auto end = inv.args.vertex_ids("end");
    if (!end.ok()) return report(inv.err, end);
    if (start.value().size() != 1 || end.value().size() != 1) {
        return usage_error(inv.err, "csp requires exactly one --start and one --end vertex");
    }
    auto constraints = read_constraints(inv.args);
    if (!constraints.ok()) return report(inv.err, constraints);

    auto graph = load_graph(inv);
    if (!graph.ok()) return report(inv.err, graph);

    const core::VertexId from = start.value().front();
    const core::VertexId to = end.value().front();
    search::ConstrainedPathSearch csp(graph.value(), inv.search);
    auto path = csp.find(from, to, constraints.value());
    if (!path.ok()) return report(inv.err, path);

    if (!path.value()) {
        inv.out << "Vertex " << to << " is not reachable from vertex " << from
                << " within the given constraints." << std::endl;
        return kExitNotFound;
    }
    inv.out << "Constrained shortest path from vertex " << from << " to vertex " << to
            << " with total cost of " << path.value()->score << "." << std::endl;
    for (auto v : path.value()->vertices) {
        inv.out << v << std::endl;
    }
    return kExitOk;
}

core::Result<search::CycleRequest> read_cycle_request(const Arguments& args) {
    using Out = core::Result<search::CycleRequest>;
    static const std::vector<std::string> kModes = {
        "shortest", "longest", "all", "count", "head", "take-n", "girth", "hamiltonian"};

    std::optional<search::CycleRequest> request;
    for (const auto& mode : kModes) {
        if (!args.has(mode)) continue;
        if (request) {
            return Out::error(core::Error::Code::INVALID_ARGUMENT, "Only one cycle mode may be given");
        }
        size_t n = 0;
        if (mode == "take-n") {
            auto value = args.unsigned_value(mode);
            if (!value.ok()) return Out::propagate(value);
            n = static_cast<size_t>(*value.value());
        } else {
            auto plain = args.expect_switch(mode);
            if (!plain.ok()) return Out::propagate(plain);
        }
        request = search::parse_request(mode, n);
    }
    if (!request) {
        return Out::error(core::Error::Code::INVALID_ARGUMENT,
                          "cycle requires one of --shortest, --longest, --all, --count, --head, "
                          "--take-n N, --girth or --hamiltonian");
    }
    return Out(std::move(*request));
}

int cmd_cycle(Invocation& inv) {
    auto request = read_cycle_request(inv.args);
    if (!request.ok()) return report(inv.err, request);
    auto constraints = read_constraints(inv.args);
    if (!constraints.ok()) return report(inv.err, constraints);

    auto graph = load_graph(inv);
    if (!graph.ok()) return report(inv.err, graph);

    search::CycleEnumerator enumerator(graph.value(), inv.search);
    auto outcome = enumerator.run(request.value(), constraints.value());
    if (!outcome.ok()) return report(inv.err, outcome);

    const auto& result = outcome.value();
    const auto& mode = request.value();
    if (std::holds_alternative<search::CountCycles>(mode)) {
        inv.out << "count: " << result.count << std::endl;
        return kExitOk;
    }
    if (std::holds_alternative<search::Girth>(mode)) {
        inv.out << "girth: " << (result.girth ? std::to_string(*result.girth) : "Infinity") << std::endl;
        return result.found() ? kExitOk : kExitNotFound;
    }

    std::string label;
    if (std::holds_alternative<search::ShortestCycle>(mode)) label = "shortest cycle: ";
    if (std::holds_alternative<search::LongestCycle>(mode)) label = "longest cycle: ";
    if (std::holds_alternative<search::HamiltonianCycle>(mode)) label = "hamiltonian cycle: ";

    if (!label.empty() && result.cycles.empty()) {
        inv.out << label << "N/A" << std::endl;
    }
    for (const auto& cycle : result.cycles) {
        inv.out << label << core::to_string(cycle.vertices) << std::endl;
    }
    return result.found() ? kExitOk : kExitNotFound;
}

const std::map<std::string, CommandSpec>& commands() {
    static const std::map<std::string, CommandSpec> kCommands = [] {
        std::map<std::string, CommandSpec> specs;
        specs["init"] = {{}, cmd_init, "Create an empty graph store"};
        specs["add"] = {{"vertex", "edge", "chain", "cycle", "star", "clique", "reverse", "weight"},
                        cmd_add, "Append vertices and edges"};
        specs["delete"] = {{"vertex", "edge"}, cmd_delete, "Append vertex and edge removals"};
        specs["build"] = {{}, cmd_build, "Compact the log into the current graph"};
        specs["clean"] = {{}, cmd_clean, "Delete the graph store"};
        specs["log"] = {{}, cmd_log, "Print the command log"};
        specs["import"] = {{"file"}, cmd_import, "Append commands from a text file"};
        specs["desc"] = {{}, cmd_desc, "Print graph statistics"};
        specs["topo-sort"] = {{}, cmd_topo_sort, "Print a topological order"};

        std::set<std::string> csp_options = kConstraintOptions;
        csp_options.insert({"start", "end", "ordered", "include-cycle", "no-cycle", "max-expansions"});
        specs["csp"] = {csp_options, cmd_csp, "Constrained shortest path"};

        std::set<std::string> cycle_options = kConstraintOptions;
        cycle_options.insert({"shortest", "longest", "all", "count", "head", "take-n", "girth",
                              "hamiltonian", "max-expansions"});
        specs["cycle"] = {cycle_options, cmd_cycle, "Cycle queries"};
        return specs;
    }();
    return kCommands;
}

} // namespace

void print_usage(std::ostream& out) {
    out << "Usage: hgraph <command> [--path DIR] [--verbose] [OPTIONS]" << std::endl;
    out << "Commands:" << std::endl;
    for (const auto& [name, spec] : commands()) {
        out << "  " << name;
        for (size_t pad = name.size(); pad < 12; ++pad) out << ' ';
        out << spec.summary << std::endl;
    }
    out << "Common options:" << std::endl;
    out << "  --path DIR           Graph root directory (default: .)" << std::endl;
    out << "  --verbose            Log debug output to stderr" << std::endl;
    out << "  --max-expansions N   Abort csp/cycle searches after N expansions" << std::endl;
    out << "  --help, -h           Show this help message" << std::endl;
    out << "  --version            Show the version" << std::endl;
}

int run(const std::vector<std::string>& argv, std::ostream& out, std::ostream& err) {
    if (argv.empty()) {
        print_usage(err);
        return kExitUsage;
    }
    const std::string& name = argv.front();
    if (name == "--help" || name == "-h" || name == "help") {
        print_usage(out);
        return kExitOk;
    }
    if (name == "--version") {
        out << "hgraph " << HGRAPH_VERSION << std::endl;
        return kExitOk;
    }

    auto spec = commands().find(name);
    if (spec == commands().end()) {
        return usage_error(err, "Unknown command: " + name);
    }

    auto parsed = Arguments::parse(std::vector<std::string>(argv.begin() + 1, argv.end()));
    if (!parsed.ok()) return report(err, parsed);
    const Arguments& args = parsed.value();

    std::set<std::string> known = spec->second.options;
    known.insert({"path", "verbose"});
    auto allowed = args.expect_only(known);
    if (!allowed.ok()) return report(err, allowed);

    auto verbose = args.expect_switch("verbose");
    if (!verbose.ok()) return report(err, verbose);
    if (args.has("verbose")) {
        common::Logger::SetLevel(spdlog::level::debug);
    }

    auto path = args.string_value("path");
    if (!path.ok()) return report(err, path);
    auto expansions = args.unsigned_value("max-expansions");
    if (!expansions.ok()) return report(err, expansions);

    Invocation inv{args, core::StoreConfig::AtRoot(path.value().value_or(".")),
                   core::SearchConfig::Bounded(expansions.value().value_or(0)), out, err};
    HGRAPH_DEBUG("Running '{}' on {}", name, inv.store.store_dir());
    return spec->second.handler(inv);
}

} // namespace cli
} // namespace hgraph
