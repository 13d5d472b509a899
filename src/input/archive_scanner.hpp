#pragma once

#include "entry_classifier.hpp"
#include "../decompiler_options.hpp"
#include <cstddef>
#include <istream>
#include <string>

class ClassCache;
class OutputSink;
class NestedArchiveHandler;

enum class ScanStatus {
    completed,
    truncated,   // archive opened but became unreadable part way through
    open_failed
};

struct ScanResult {
    ScanStatus status = ScanStatus::completed;
    std::size_t classes = 0;
    std::size_t class_failures = 0;
    std::size_t resources = 0;
    std::size_t resource_failures = 0;
    std::size_t nested_archives = 0;
    std::size_t nested_failures = 0;
    std::size_t skipped = 0;

    std::size_t failures() const { return class_failures + resource_failures + nested_failures; }
};

// Single pass over an archive: class bytes go to the cache, nested archives to
// the nested handler, resources straight to the output sink.
class ArchiveScanner {
public:
    ArchiveScanner(const DecompilerOptions& options, ClassCache& cache, OutputSink& output,
                   NestedArchiveHandler& nested_handler);

    ScanResult scan(const std::string& archive_path);

private:
    bool process_class(const std::string& entry_name, std::istream& data);
    bool process_nested_archive(const std::string& entry_name, std::istream& data);
    bool process_resource(const std::string& entry_name, std::istream& data);

    const DecompilerOptions& options_;
    EntryClassifier classifier_;
    ClassCache& cache_;
    OutputSink& output_;
    NestedArchiveHandler& nested_handler_;
};
