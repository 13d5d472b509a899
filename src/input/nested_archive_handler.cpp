#include "nested_archive_handler.hpp"
#include "pipeline.hpp"
#include "../decompiler/decompiler.hpp"
#include "../io/stream_utils.hpp"
#include "../io/temp_file.hpp"
#include <fstream>
#include <iostream>
#include <utility>

namespace {

constexpr char TEMP_PREFIX[] = "jdZipTemp-";
constexpr char TEMP_SUFFIX[] = ".jar";
constexpr char NESTED_SCOPE_SUFFIX[] = ".src";

} // namespace

NestedArchiveHandler::NestedArchiveHandler(Decompiler& decompiler, OutputFactory output_factory)
    : decompiler_(decompiler), output_factory_(std::move(output_factory)) {}

std::optional<std::filesystem::path> NestedArchiveHandler::inner_scope(const OutputSink& parent,
                                                                       const std::string& entry_name) {
    std::filesystem::path relative = std::filesystem::path(entry_name).lexically_normal();
    if (relative.empty() || relative.has_root_path() || *relative.begin() == "..") {
        return std::nullopt;
    }

    auto target = parent.target_dir();
    if (!target) {
        return relative;
    }
    return *target / relative;
}

bool NestedArchiveHandler::process(std::istream& input, const std::filesystem::path& output_scope) {
    const auto& options = decompiler_.options();
    std::filesystem::path nested_scope = output_scope;
    nested_scope += NESTED_SCOPE_SUFFIX;

    try {
        TempFile staged(options.temp_directory, TEMP_PREFIX, TEMP_SUFFIX);
        {
            std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw TempFileException("Cannot write temp file " + staged.path().string());
            }
            copy_stream(input, out);
        }

        if (options.verbose) {
            std::cout << "Decompiling nested archive into " << nested_scope.string() << std::endl;
        }

        auto nested_output = output_factory_(nested_scope);
        if (!nested_output) {
            std::cerr << "Error: No output available for nested archive " << nested_scope.string() << std::endl;
            return false;
        }

        Pipeline nested(staged.path().string(), decompiler_, *nested_output, output_factory_);
        PipelineResult result = nested.run();
        return result.status != PipelineStatus::archive_open_failed;
    } catch (const std::exception& e) {
        std::cerr << "Error: Processing nested archive " << nested_scope.string() << " failed: " << e.what() << std::endl;
        return false;
    }
}
