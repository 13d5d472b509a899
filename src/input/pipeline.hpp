#pragma once

#include "../output/output_sink.hpp"
#include <cstddef>
#include <string>

class Decompiler;

enum class PipelineState {
    idle,
    initialized,
    scanning,
    dispatching,
    committed
};

enum class PipelineStatus {
    completed,
    completed_with_errors,
    archive_open_failed
};

const char* to_string(PipelineStatus status);

struct PipelineResult {
    PipelineStatus status = PipelineStatus::completed;
    std::size_t cached_classes = 0;
    std::size_t dispatched_classes = 0;
    std::size_t decompiled_classes = 0;
    std::size_t failed_classes = 0;
    std::size_t resources = 0;
    std::size_t nested_archives = 0;
};

// One archive-processing call: init the sink, scan the archive into a
// call-scoped class cache, dispatch the cached classes, commit the sink.
// A Pipeline runs once; run() on a committed pipeline throws std::logic_error.
class Pipeline {
public:
    Pipeline(std::string archive_path, Decompiler& decompiler, OutputSink& output);
    Pipeline(std::string archive_path, Decompiler& decompiler, OutputSink& output, OutputFactory nested_output_factory);

    // The sink is committed even when the archive cannot be opened; that case
    // is reported as PipelineStatus::archive_open_failed.
    PipelineResult run();

    PipelineState state() const { return state_; }

private:
    std::string archive_path_;
    Decompiler& decompiler_;
    OutputSink& output_;
    OutputFactory nested_output_factory_;
    PipelineState state_ = PipelineState::idle;
};
