#include "dispatch_engine.hpp"
#include "entry_classifier.hpp"
#include "../decompiler/decompiler.hpp"
#include "../loader/class_cache.hpp"
#include "../output/output_sink.hpp"
#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <thread>

DispatchEngine::DispatchEngine(Decompiler& decompiler, OutputSink& output, const DecompilerOptions& options)
    : decompiler_(decompiler), output_(output), options_(options) {}

std::vector<std::string> DispatchEngine::dispatch_set(const ClassCache& cache) {
    std::vector<std::string> class_names;
    class_names.reserve(cache.size());
    for (const auto& class_name : cache.class_names()) {
        if (!is_inner_class(class_name)) {
            class_names.push_back(class_name);
        }
    }
    return class_names;
}

DispatchStats DispatchEngine::dispatch(const ClassCache& cache) {
    auto class_names = dispatch_set(cache);

    if (options_.verbose) {
        std::cout << "Decompiling " << class_names.size() << " classes..." << std::endl;
    }

    if (options_.parallel_processing && class_names.size() > 1) {
        return dispatch_parallel(cache, class_names);
    }
    return dispatch_sequential(cache, class_names);
}

DispatchStats DispatchEngine::dispatch_sequential(const ClassCache& cache, const std::vector<std::string>& class_names) {
    DispatchStats stats;
    for (const auto& class_name : class_names) {
        stats.dispatched++;
        if (dispatch_class(cache, class_name)) {
            stats.decompiled++;
        } else {
            stats.failed++;
        }
    }
    return stats;
}

DispatchStats DispatchEngine::dispatch_parallel(const ClassCache& cache, const std::vector<std::string>& class_names) {
    std::size_t workers = worker_count(class_names.size());
    std::atomic<std::size_t> next_index{0};

    std::vector<std::future<DispatchStats>> futures;
    futures.reserve(workers);

    for (std::size_t i = 0; i < workers; ++i) {
        futures.emplace_back(
            std::async(std::launch::async, [this, &cache, &class_names, &next_index]() {
                DispatchStats local;
                for (std::size_t index = next_index++; index < class_names.size(); index = next_index++) {
                    local.dispatched++;
                    if (dispatch_class(cache, class_names[index])) {
                        local.decompiled++;
                    } else {
                        local.failed++;
                    }
                }
                return local;
            })
        );
    }

    DispatchStats stats;
    for (auto& future : futures) {
        DispatchStats local = future.get();
        stats.dispatched += local.dispatched;
        stats.decompiled += local.decompiled;
        stats.failed += local.failed;
    }
    return stats;
}

bool DispatchEngine::dispatch_class(const ClassCache& cache, const std::string& class_name) {
    try {
        std::string source = decompiler_.decompile_class(cache, class_name);
        output_.process_class(class_name, source);

        if (options_.verbose) {
            std::cout << "Decompiled: " << class_name << std::endl;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error decompiling class " << class_name << ": " << e.what() << std::endl;
        return false;
    }
}

std::size_t DispatchEngine::worker_count(std::size_t work_items) const {
    int job_count = options_.job_count;
    if (job_count <= 0) {
        job_count = static_cast<int>(std::thread::hardware_concurrency());
        if (job_count <= 0) {
            job_count = 4; // fallback
        }
    }
    return std::min(static_cast<std::size_t>(job_count), work_items);
}
