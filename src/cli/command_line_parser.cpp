#include "command_line_parser.hpp"
#include "../input/entry_classifier.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

std::optional<DecompilerOptions> CommandLineParser::parse(int argc, char* argv[]) {
    DecompilerOptions options;

    if (argc < 2) {
        print_help();
        return std::nullopt;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        } else if (arg == "--version" || arg == "-v") {
            print_version();
            return std::nullopt;
        } else if (arg == "-od" || arg == "--output-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            options.output_directory = argv[++i];
        } else if (arg == "-oc" || arg == "--output-console") {
            options.console_output = true;
        } else if (arg == "-n" || arg == "--skip-resources") {
            options.skip_resources = true;
        } else if (arg == "-dj" || arg == "--decompile-inner-jars") {
            options.decompile_inner_jars = true;
        } else if (arg == "-p" || arg == "--parallel") {
            options.parallel_processing = true;
        } else if (arg == "-j" || arg == "--jobs") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            try {
                options.job_count = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: " << arg << " expects a number, got " << argv[i] << std::endl;
                return std::nullopt;
            }
            if (options.job_count < 0) {
                std::cerr << "Error: " << arg << " must not be negative" << std::endl;
                return std::nullopt;
            }
            if (options.job_count != 1) {
                options.parallel_processing = true;
            }
        } else if (arg == "--pattern") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            options.include_pattern = argv[++i];
        } else if (arg == "--exclude") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            options.exclude_pattern = argv[++i];
        } else if (arg == "--temp-dir") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return std::nullopt;
            }
            options.temp_directory = argv[++i];
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return std::nullopt;
        } else {
            // Input archive
            if (options.input_file.empty()) {
                options.input_file = arg;
            } else {
                std::cerr << "Error: Multiple input files specified" << std::endl;
                return std::nullopt;
            }
        }
    }

    if (options.input_file.empty()) {
        std::cerr << "Error: No input file specified" << std::endl;
        return std::nullopt;
    }

    if (!std::filesystem::exists(options.input_file)) {
        std::cerr << "Error: Input file does not exist: " << options.input_file << std::endl;
        return std::nullopt;
    }

    try {
        EntryClassifier validate(options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::nullopt;
    }

    return options;
}

void CommandLineParser::print_help() {
    std::cout << "jd-cpp - Java archive decompiler\n\n";
    std::cout << "Usage: jd-cpp [options] <jar|war|ear|zip>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                  Show this help message\n";
    std::cout << "  -v, --version               Show version information\n";
    std::cout << "  -od, --output-dir <dir>     Output directory (default: <input>.src)\n";
    std::cout << "  -oc, --output-console       Print decompiled classes to the console\n";
    std::cout << "  -n, --skip-resources        Do not copy resource files\n";
    std::cout << "  -dj, --decompile-inner-jars Decompile nested jar/war/ear/zip archives\n";
    std::cout << "  -p, --parallel              Decompile classes in parallel\n";
    std::cout << "  -j, --jobs <count>          Number of threads (default: auto, implies --parallel unless 1)\n";
    std::cout << "  --pattern <regex>           Only process entries whose name matches\n";
    std::cout << "  --exclude <regex>           Skip entries whose name matches\n";
    std::cout << "  --temp-dir <dir>            Directory for staging nested archives\n";
    std::cout << "  --verbose                   Verbose output\n";
}

void CommandLineParser::print_version() {
    std::cout << "jd-cpp version 1.0.0\n";
}
