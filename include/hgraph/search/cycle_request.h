#ifndef HGRAPH_SEARCH_CYCLE_REQUEST_H_
#define HGRAPH_SEARCH_CYCLE_REQUEST_H_

#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace hgraph {
namespace search {

/// Shortest satisfying cycle; ties by score, lowest start vertex, then sequence.
struct ShortestCycle {};
/// Longest satisfying cycle; ties by score, lowest start vertex, then sequence.
struct LongestCycle {};
/// Every satisfying cycle in discovery order.
struct AllCycles {};
/// Number of satisfying cycles, without materializing them.
struct CountCycles {};
/// First satisfying cycle in discovery order.
struct HeadCycle {};
/// First `n` satisfying cycles in discovery order.
struct TakeCycles {
    size_t n = 0;
};
/// Length of the globally shortest cycle. Accepts no constraints.
struct Girth {};
/// A cycle through every vertex exactly once.
struct HamiltonianCycle {};

using CycleRequest = std::variant<ShortestCycle, LongestCycle, AllCycles, CountCycles,
                                  HeadCycle, TakeCycles, Girth, HamiltonianCycle>;

/// Mode name as accepted by the command line, e.g. "take-n".
std::string request_name(const CycleRequest& request);

/**
 * @brief Parses a mode name ("shortest", "longest", "all", "count", "head",
 * "take-n", "girth", "hamiltonian")
 * @param n cycle count used by "take-n"
 */
std::optional<CycleRequest> parse_request(const std::string& name, size_t n = 0);

} // namespace search
} // namespace hgraph

#endif // HGRAPH_SEARCH_CYCLE_REQUEST_H_
