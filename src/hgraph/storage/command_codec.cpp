#include "hgraph/storage/command_codec.h"

#include <cstdint>
#include <sstream>

namespace hgraph {
namespace storage {

namespace {

bool parse_id(const std::string& token, uint64_t& out) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stoull(token, &consumed);
        return consumed == token.size();
    } catch (const std::out_of_range&) {
        return false;
    }
}

core::Result<core::Command> parse_failure(const std::string& message) {
    return core::Result<core::Command>::error(core::Error::Code::PARSE_ERROR, message);
}

} // namespace

std::string format_command(const core::Command& command) {
    std::ostringstream oss;
    oss << core::to_string(command.type) << " " << command.a;
    if (command.is_edge_command()) {
        oss << " " << command.b;
    }
    if (command.type == core::CommandType::ADD_EDGE && command.weight != core::kDefaultWeight) {
        oss << " " << command.weight;
    }
    return oss.str();
}

std::string format_commands(const std::vector<core::Command>& commands) {
    std::string out;
    for (const auto& cmd : commands) {
        out += format_command(cmd);
        out += "\n";
    }
    return out;
}

core::Result<core::Command> parse_command(const std::string& line) {
    std::istringstream iss(line);
    std::string keyword;
    std::vector<std::string> args;
    iss >> keyword;
    for (std::string token; iss >> token;) {
        args.push_back(token);
    }

    std::vector<uint64_t> values;
    for (const auto& arg : args) {
        uint64_t v = 0;
        if (!parse_id(arg, v)) {
            return parse_failure("Invalid number '" + arg + "' in: " + line);
        }
        values.push_back(v);
    }

    core::Command cmd;
    if (keyword == "AddVertex" && values.size() == 1) {
        cmd = core::Command::AddVertex(values[0]);
    } else if (keyword == "RemoveVertex" && values.size() == 1) {
        cmd = core::Command::RemoveVertex(values[0]);
    } else if (keyword == "AddEdge" && (values.size() == 2 || values.size() == 3)) {
        uint64_t weight = values.size() == 3 ? values[2] : core::kDefaultWeight;
        if (weight == 0 || weight > UINT32_MAX) {
            return parse_failure("Invalid edge weight in: " + line);
        }
        cmd = core::Command::AddEdge(values[0], values[1], static_cast<core::Weight>(weight));
    } else if (keyword == "RemoveEdge" && values.size() == 2) {
        cmd = core::Command::RemoveEdge(values[0], values[1]);
    } else {
        return parse_failure("Unrecognized command: " + line);
    }

    if (cmd.a == core::kInvalidVertex || (cmd.is_edge_command() && cmd.b == core::kInvalidVertex)) {
        return parse_failure("Vertex id 0 in: " + line);
    }
    return core::Result<core::Command>(cmd);
}

core::Result<std::vector<core::Command>> parse_commands(const std::string& text) {
    std::vector<core::Command> commands;
    std::istringstream iss(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(iss, line)) {
        ++line_no;
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        auto cmd = parse_command(line.substr(first));
        if (!cmd.ok()) {
            return core::Result<std::vector<core::Command>>::error(
                core::Error::Code::PARSE_ERROR, "line " + std::to_string(line_no) + ": " + cmd.error());
        }
        commands.push_back(cmd.value());
    }
    return core::Result<std::vector<core::Command>>(std::move(commands));
}

} // namespace storage
} // namespace hgraph
