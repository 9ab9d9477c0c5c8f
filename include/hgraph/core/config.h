#ifndef HGRAPH_CORE_CONFIG_H_
#define HGRAPH_CORE_CONFIG_H_

#include <atomic>
#include <cstdint>
#include <string>

#include "hgraph/config.h"

namespace hgraph {
namespace core {

/**
 * @brief Location and durability settings of a graph store
 *
 * The log lives at `<root_dir>/<graph_dir_name>/<commands_file>` and the
 * advisory lock at `<root_dir>/<graph_dir_name>/<lock_file>`.
 */
struct StoreConfig {
    std::string root_dir;
    std::string graph_dir_name;
    std::string commands_file;
    std::string lock_file;
    bool sync_on_append;         // fsync after every append

    StoreConfig()
        : root_dir("."),
          graph_dir_name(HGRAPH_STORE_DIR_NAME),
          commands_file(HGRAPH_COMMANDS_FILE_NAME),
          lock_file(HGRAPH_LOCK_FILE_NAME),
          sync_on_append(true) {}

    static StoreConfig Default() {
        return StoreConfig();
    }

    static StoreConfig AtRoot(const std::string& root) {
        StoreConfig config;
        config.root_dir = root;
        return config;
    }

    std::string store_dir() const { return root_dir + "/" + graph_dir_name; }
    std::string commands_path() const { return store_dir() + "/" + commands_file; }
    std::string lock_path() const { return store_dir() + "/" + lock_file; }
};

/**
 * @brief Bounds on a single search invocation
 */
struct SearchConfig {
    uint64_t max_expansions;                // 0 = unlimited
    const std::atomic<bool>* cancel;        // optional, not owned

    SearchConfig() : max_expansions(0), cancel(nullptr) {}

    static SearchConfig Default() {
        return SearchConfig();
    }

    static SearchConfig Bounded(uint64_t expansions) {
        SearchConfig config;
        config.max_expansions = expansions;
        return config;
    }
};

} // namespace core
} // namespace hgraph

#endif // HGRAPH_CORE_CONFIG_H_
