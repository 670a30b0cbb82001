#include <iostream>
#include <string>
#include <vector>

#include <skumaster/cli/ProductCli.hpp>

int main(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 0 ? static_cast<size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    return SkuMaster::cli::run(args, std::cout, std::cerr);
}
