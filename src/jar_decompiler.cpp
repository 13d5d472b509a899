#include "jar_decompiler.hpp"
#include "decompiler/class_skeleton_decompiler.hpp"
#include "output/directory_output.hpp"
#include "output/multi_output.hpp"
#include "output/print_stream_output.hpp"
#include <iostream>
#include <vector>

JarDecompiler::JarDecompiler(const DecompilerOptions& options) : options_(options) {}

bool JarDecompiler::decompile() {
    ClassSkeletonDecompiler decompiler(options_);

    std::unique_ptr<OutputSink> output = create_output();

    Pipeline pipeline(options_.input_file, decompiler, *output, make_directory_output);
    result_ = pipeline.run();

    if (result_.status == PipelineStatus::archive_open_failed) {
        std::cerr << "Error: Failed to open archive: " << options_.input_file << std::endl;
        return false;
    }

    if (options_.verbose || result_.status == PipelineStatus::completed_with_errors) {
        std::cout << "Decompiled " << result_.decompiled_classes << " of " << result_.dispatched_classes
                  << " classes (" << result_.failed_classes << " failed)" << std::endl;
    }

    return result_.status == PipelineStatus::completed;
}

std::unique_ptr<OutputSink> JarDecompiler::create_output() {
    std::vector<std::unique_ptr<OutputSink>> outputs;

    if (!options_.output_directory.empty()) {
        outputs.push_back(std::make_unique<DirectoryOutput>(options_.output_directory));
    }
    if (options_.console_output) {
        outputs.push_back(std::make_unique<PrintStreamOutput>(std::cout));
    }
    if (outputs.empty()) {
        outputs.push_back(std::make_unique<DirectoryOutput>(default_output_directory()));
    }

    if (outputs.size() == 1) {
        return std::move(outputs.front());
    }
    return std::make_unique<MultiOutput>(std::move(outputs));
}

std::string JarDecompiler::default_output_directory() const {
    return options_.input_file + ".src";
}
