#ifndef HGRAPH_CONFIG_H_
#define HGRAPH_CONFIG_H_

// Project version
#define HGRAPH_VERSION_MAJOR 1
#define HGRAPH_VERSION_MINOR 0
#define HGRAPH_VERSION_PATCH 0
#define HGRAPH_VERSION "1.0.0"

// Store layout defaults, relative to the store root
#define HGRAPH_STORE_DIR_NAME ".graph"
#define HGRAPH_COMMANDS_FILE_NAME "commands"
#define HGRAPH_LOCK_FILE_NAME "lock"

#endif // HGRAPH_CONFIG_H_
