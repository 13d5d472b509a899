#pragma once

#include <string>

struct DecompilerOptions {
    std::string input_file;

    // Output selection (default: <input>.src directory)
    std::string output_directory;
    bool console_output = false;

    // Entry filtering
    bool skip_resources = false;
    std::string include_pattern; // ECMAScript regex matched against the whole entry name
    std::string exclude_pattern;

    // Nested archives
    bool decompile_inner_jars = false;
    std::string temp_directory; // empty = system temp directory

    // Threading
    bool parallel_processing = false;
    int job_count = 0; // 0 = auto-detect

    // Verbose output
    bool verbose = false;
};
