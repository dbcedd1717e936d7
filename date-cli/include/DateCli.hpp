#pragma once
#include <iostream>
#include <span>
#include <string_view>

#include "plaindate/PlainDate.hpp"

namespace plaindate::cli {

// Runs one subcommand. `args` excludes the program name.
// Returns 0 on success, 1 on usage errors, 2 on invalid input.
int run(std::span<const std::string_view> args,
        std::ostream& out = std::cout,
        std::ostream& err = std::cerr,
        const NowFunction& now = systemNow);

} // namespace plaindate::cli
