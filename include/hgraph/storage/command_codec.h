#ifndef HGRAPH_STORAGE_COMMAND_CODEC_H_
#define HGRAPH_STORAGE_COMMAND_CODEC_H_

#include <string>
#include <vector>

#include "hgraph/core/result.h"
#include "hgraph/core/types.h"

namespace hgraph {
namespace storage {

/**
 * @brief Human-readable rendering of commands, one per line
 *
 *   AddVertex 3
 *   AddEdge 1 2        (weight 1)
 *   AddEdge 1 2 5
 *   RemoveVertex 3
 *   RemoveEdge 1 2
 *
 * Blank lines and lines starting with '#' are ignored when parsing.
 */
std::string format_command(const core::Command& command);

std::string format_commands(const std::vector<core::Command>& commands);

core::Result<core::Command> parse_command(const std::string& line);

/// Parses a whole document; errors name the 1-based line number.
core::Result<std::vector<core::Command>> parse_commands(const std::string& text);

} // namespace storage
} // namespace hgraph

#endif // HGRAPH_STORAGE_COMMAND_CODEC_H_
