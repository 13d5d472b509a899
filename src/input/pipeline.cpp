#include "pipeline.hpp"
#include "archive_scanner.hpp"
#include "dispatch_engine.hpp"
#include "nested_archive_handler.hpp"
#include "../decompiler/decompiler.hpp"
#include "../loader/class_cache.hpp"
#include "../output/directory_output.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

const char* to_string(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::completed: return "completed";
        case PipelineStatus::completed_with_errors: return "completed with errors";
        case PipelineStatus::archive_open_failed: return "archive open failed";
    }
    return "unknown";
}

Pipeline::Pipeline(std::string archive_path, Decompiler& decompiler, OutputSink& output)
    : Pipeline(std::move(archive_path), decompiler, output, make_directory_output) {}

Pipeline::Pipeline(std::string archive_path, Decompiler& decompiler, OutputSink& output,
                   OutputFactory nested_output_factory)
    : archive_path_(std::move(archive_path)),
      decompiler_(decompiler),
      output_(output),
      nested_output_factory_(std::move(nested_output_factory)) {}

PipelineResult Pipeline::run() {
    if (state_ != PipelineState::idle) {
        throw std::logic_error("Pipeline for " + archive_path_ + " has already run");
    }

    const DecompilerOptions& options = decompiler_.options();
    PipelineResult result;

    if (options.verbose) {
        std::cout << "Initializing decompilation of " << archive_path_ << std::endl;
    }

    output_.init(options, archive_path_);
    state_ = PipelineState::initialized;

    ClassCache cache;
    NestedArchiveHandler nested_handler(decompiler_, nested_output_factory_);
    ArchiveScanner scanner(options, cache, output_, nested_handler);

    state_ = PipelineState::scanning;
    ScanResult scan = scanner.scan(archive_path_);

    state_ = PipelineState::dispatching;
    DispatchEngine engine(decompiler_, output_, options);
    DispatchStats dispatch = engine.dispatch(cache);

    output_.commit();
    state_ = PipelineState::committed;

    result.cached_classes = cache.size();
    result.dispatched_classes = dispatch.dispatched;
    result.decompiled_classes = dispatch.decompiled;
    result.failed_classes = dispatch.failed;
    result.resources = scan.resources;
    result.nested_archives = scan.nested_archives;

    if (scan.status == ScanStatus::open_failed) {
        result.status = PipelineStatus::archive_open_failed;
    } else if (scan.status == ScanStatus::truncated || scan.failures() > 0 || dispatch.failed > 0) {
        result.status = PipelineStatus::completed_with_errors;
    }

    if (options.verbose) {
        std::cout << archive_path_ << ": " << to_string(result.status) << ", "
                  << result.decompiled_classes << "/" << result.dispatched_classes << " classes decompiled, "
                  << result.resources << " resources, "
                  << result.nested_archives << " nested archives" << std::endl;
    }

    return result;
}
