#ifndef HGRAPH_CLI_CLI_H_
#define HGRAPH_CLI_CLI_H_

#include <ostream>
#include <string>
#include <vector>

namespace hgraph {
namespace cli {

constexpr int kExitOk = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage = 2;

/**
 * @brief Runs one `hgraph` invocation
 *
 * `args` excludes the program name: `{"csp", "--start", "1", "--end", "4"}`.
 * Results go to `out`, diagnostics to `err`.
 *
 * @return 0 on success, 1 when a query has no solution, 2 on usage errors,
 *         otherwise core::exit_code_for() of the failure
 */
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

void print_usage(std::ostream& out);

} // namespace cli
} // namespace hgraph

#endif // HGRAPH_CLI_CLI_H_
