#pragma once

#include "../decompiler_options.hpp"
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

// Destination for one pipeline run. init() and commit() are called exactly once
// per run; process_resource() and process_class() any number of times in
// between. process_class() may be called from several threads at once when
// parallel dispatch is enabled. Failures are reported by throwing.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void init(const DecompilerOptions& options, const std::string& archive_path) = 0;

    // The stream is only valid for the duration of the call.
    virtual void process_resource(const std::string& entry_name, std::istream& data) = 0;

    virtual void process_class(const std::string& class_name, const std::string& source) = 0;

    virtual void commit() = 0;

    // Directory nested archive output is placed under, if the sink has one.
    virtual std::optional<std::filesystem::path> target_dir() const { return std::nullopt; }
};

// Creates the sink a nested archive is decompiled into.
using OutputFactory = std::function<std::unique_ptr<OutputSink>(const std::filesystem::path& scope)>;
