#include "hgraph/search/cycle_request.h"

namespace hgraph {
namespace search {

std::string request_name(const CycleRequest& request) {
    if (std::holds_alternative<ShortestCycle>(request)) return "shortest";
    if (std::holds_alternative<LongestCycle>(request)) return "longest";
    if (std::holds_alternative<AllCycles>(request)) return "all";
    if (std::holds_alternative<CountCycles>(request)) return "count";
    if (std::holds_alternative<HeadCycle>(request)) return "head";
    if (std::holds_alternative<TakeCycles>(request)) return "take-n";
    if (std::holds_alternative<Girth>(request)) return "girth";
    return "hamiltonian";
}

std::optional<CycleRequest> parse_request(const std::string& name, size_t n) {
    if (name == "shortest") return CycleRequest(ShortestCycle{});
    if (name == "longest") return CycleRequest(LongestCycle{});
    if (name == "all") return CycleRequest(AllCycles{});
    if (name == "count") return CycleRequest(CountCycles{});
    if (name == "head") return CycleRequest(HeadCycle{});
    if (name == "take-n") return CycleRequest(TakeCycles{n});
    if (name == "girth") return CycleRequest(Girth{});
    if (name == "hamiltonian") return CycleRequest(HamiltonianCycle{});
    return std::nullopt;
}

} // namespace search
} // namespace hgraph
