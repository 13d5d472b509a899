#pragma once

#include "../decompiler_options.hpp"
#include <cstddef>
#include <string>
#include <vector>

class ClassCache;
class Decompiler;
class OutputSink;

struct DispatchStats {
    std::size_t dispatched = 0;
    std::size_t decompiled = 0;
    std::size_t failed = 0;
};

// Decompiles every top-level cached class and hands the source to the output
// sink, one class at a time or across a bounded pool of workers.
class DispatchEngine {
public:
    DispatchEngine(Decompiler& decompiler, OutputSink& output, const DecompilerOptions& options);

    DispatchStats dispatch(const ClassCache& cache);

    // Cached names in cache order, inner classes excluded.
    static std::vector<std::string> dispatch_set(const ClassCache& cache);

private:
    DispatchStats dispatch_sequential(const ClassCache& cache, const std::vector<std::string>& class_names);
    DispatchStats dispatch_parallel(const ClassCache& cache, const std::vector<std::string>& class_names);
    bool dispatch_class(const ClassCache& cache, const std::string& class_name);
    std::size_t worker_count(std::size_t work_items) const;

    Decompiler& decompiler_;
    OutputSink& output_;
    const DecompilerOptions& options_;
};
