#pragma once

#include "decompiler_options.hpp"
#include "input/pipeline.hpp"
#include "output/output_sink.hpp"
#include <memory>

// Entry point used by the command line: picks the outputs from the options and
// runs the archive pipeline over the input file.
class JarDecompiler {
public:
    explicit JarDecompiler(const DecompilerOptions& options);

    bool decompile();

    const PipelineResult& result() const { return result_; }

private:
    DecompilerOptions options_;
    PipelineResult result_;

    std::unique_ptr<OutputSink> create_output();
    std::string default_output_directory() const;
};
