#pragma once

#include "../decompiler_options.hpp"
#include <optional>

class CommandLineParser {
public:
    std::optional<DecompilerOptions> parse(int argc, char* argv[]);

private:
    void print_help();
    void print_version();
};
