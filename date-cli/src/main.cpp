#include <span>
#include <string_view>
#include <vector>

#include "DateCli.hpp"

int main(int argc, char** argv) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);

    // subArgs = everything after the program name
    std::span<const std::string_view> subArgs;
    if (!args.empty()) subArgs = std::span<const std::string_view>(args.data() + 1, args.size() - 1);
    return plaindate::cli::run(subArgs);
}
