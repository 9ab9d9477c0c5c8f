#include <iostream>
#include <string>
#include <vector>

#include "hgraph/cli/cli.h"
#include "hgraph/common/logger.h"

int main(int argc, char* argv[]) {
    hgraph::common::Logger::Init(spdlog::level::warn);

    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.emplace_back(argv[i]);
    }

    try {
        return hgraph::cli::run(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "error: Internal: " << e.what() << std::endl;
        return 9;
    }
}
