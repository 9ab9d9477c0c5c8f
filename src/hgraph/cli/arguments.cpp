#include "hgraph/cli/arguments.h"

namespace hgraph {
namespace cli {

namespace {

const std::vector<std::string> kNoValues;

bool is_flag(const std::string& token) {
    return token.size() > 2 && token.compare(0, 2, "--") == 0;
}

template<typename T>
core::Result<T> usage(const std::string& message) {
    return core::Result<T>::error(core::Error::Code::INVALID_ARGUMENT, message);
}

bool parse_unsigned(const std::string& text, uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(text);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool parse_signed(const std::string& text, int64_t& out) {
    std::string digits = text;
    if (!digits.empty() && digits[0] == '-') {
        digits = digits.substr(1);
    }
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoll(text);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

core::Result<Arguments> Arguments::parse(const std::vector<std::string>& tokens) {
    Arguments args;
    std::string current;
    for (const auto& token : tokens) {
        if (is_flag(token)) {
            current = token.substr(2);
            args.values_[current];
        } else if (current.empty()) {
            return usage<Arguments>("Unexpected argument: " + token);
        } else {
            args.values_[current].push_back(token);
        }
    }
    return core::Result<Arguments>(std::move(args));
}

const std::vector<std::string>& Arguments::values(const std::string& flag) const {
    auto it = values_.find(flag);
    return it == values_.end() ? kNoValues : it->second;
}

core::Result<void> Arguments::expect_only(const std::set<std::string>& known) const {
    for (const auto& entry : values_) {
        if (!known.count(entry.first)) {
            return usage<void>("Unknown option: --" + entry.first);
        }
    }
    return core::Result<void>();
}

core::Result<void> Arguments::expect_switch(const std::string& flag) const {
    if (!values(flag).empty()) {
        return usage<void>("Option --" + flag + " takes no value");
    }
    return core::Result<void>();
}

core::Result<std::vector<core::VertexId>> Arguments::vertex_ids(const std::string& flag) const {
    std::vector<core::VertexId> ids;
    for (const auto& text : values(flag)) {
        uint64_t id = 0;
        if (!parse_unsigned(text, id) || id == core::kInvalidVertex) {
            return usage<std::vector<core::VertexId>>("Invalid vertex id '" + text + "' for --" + flag);
        }
        ids.push_back(id);
    }
    if (has(flag) && ids.empty()) {
        return usage<std::vector<core::VertexId>>("Option --" + flag + " requires vertex ids");
    }
    return core::Result<std::vector<core::VertexId>>(std::move(ids));
}

core::Result<std::vector<core::EdgeKey>> Arguments::edge_pairs(const std::string& flag) const {
    auto ids = vertex_ids(flag);
    if (!ids.ok()) {
        return core::Result<std::vector<core::EdgeKey>>::propagate(ids);
    }
    const auto& flat = ids.value();
    if (flat.size() % 2 != 0) {
        return usage<std::vector<core::EdgeKey>>("Option --" + flag + " needs an even number of vertex ids");
    }
    std::vector<core::EdgeKey> edges;
    for (size_t i = 0; i < flat.size(); i += 2) {
        edges.emplace_back(flat[i], flat[i + 1]);
    }
    return core::Result<std::vector<core::EdgeKey>>(std::move(edges));
}

core::Result<std::optional<uint64_t>> Arguments::unsigned_value(const std::string& flag) const {
    using Out = core::Result<std::optional<uint64_t>>;
    if (!has(flag)) {
        return Out(std::optional<uint64_t>());
    }
    const auto& vals = values(flag);
    uint64_t value = 0;
    if (vals.size() != 1 || !parse_unsigned(vals[0], value)) {
        return usage<std::optional<uint64_t>>("Option --" + flag + " expects one non-negative integer");
    }
    return Out(std::optional<uint64_t>(value));
}

core::Result<std::optional<int64_t>> Arguments::signed_value(const std::string& flag) const {
    using Out = core::Result<std::optional<int64_t>>;
    if (!has(flag)) {
        return Out(std::optional<int64_t>());
    }
    const auto& vals = values(flag);
    int64_t value = 0;
    if (vals.size() != 1 || !parse_signed(vals[0], value)) {
        return usage<std::optional<int64_t>>("Option --" + flag + " expects one integer");
    }
    return Out(std::optional<int64_t>(value));
}

core::Result<std::optional<std::string>> Arguments::string_value(const std::string& flag) const {
    using Out = core::Result<std::optional<std::string>>;
    if (!has(flag)) {
        return Out(std::optional<std::string>());
    }
    const auto& vals = values(flag);
    if (vals.size() != 1) {
        return usage<std::optional<std::string>>("Option --" + flag + " expects one value");
    }
    return Out(std::optional<std::string>(vals[0]));
}

} // namespace cli
} // namespace hgraph
