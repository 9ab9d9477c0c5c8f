#ifndef HGRAPH_CLI_ARGUMENTS_H_
#define HGRAPH_CLI_ARGUMENTS_H_

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hgraph/core/result.h"
#include "hgraph/core/types.h"

namespace hgraph {
namespace cli {

/**
 * @brief Parsed `--flag value...` options of one sub-command
 *
 * Every token starting with "--" opens a flag; the tokens that follow, up to
 * the next flag, are its values. A flag may repeat, values accumulate.
 * Parse failures carry INVALID_ARGUMENT and are reported as usage errors.
 */
class Arguments {
public:
    Arguments() = default;

    static core::Result<Arguments> parse(const std::vector<std::string>& tokens);

    bool has(const std::string& flag) const { return values_.count(flag) > 0; }
    const std::vector<std::string>& values(const std::string& flag) const;

    /// Fails on any flag outside `known`.
    core::Result<void> expect_only(const std::set<std::string>& known) const;

    /// Fails if the flag carries values.
    core::Result<void> expect_switch(const std::string& flag) const;

    core::Result<std::vector<core::VertexId>> vertex_ids(const std::string& flag) const;

    /// Values read as consecutive (from, to) pairs.
    core::Result<std::vector<core::EdgeKey>> edge_pairs(const std::string& flag) const;

    /// Single non-negative integer value, nullopt when the flag is absent.
    core::Result<std::optional<uint64_t>> unsigned_value(const std::string& flag) const;

    /// Single signed integer value, nullopt when the flag is absent.
    core::Result<std::optional<int64_t>> signed_value(const std::string& flag) const;

    /// Single string value, nullopt when the flag is absent.
    core::Result<std::optional<std::string>> string_value(const std::string& flag) const;

private:
    std::map<std::string, std::vector<std::string>> values_;
};

} // namespace cli
} // namespace hgraph

#endif // HGRAPH_CLI_ARGUMENTS_H_
