#pragma once

#include "output_sink.hpp"
#include <mutex>
#include <ostream>

// Prints decompiled classes to a stream, one banner per class. Resources are ignored.
class PrintStreamOutput : public OutputSink {
public:
    explicit PrintStreamOutput(std::ostream& output);

    void init(const DecompilerOptions& options, const std::string& archive_path) override;
    void process_resource(const std::string& entry_name, std::istream& data) override;
    void process_class(const std::string& class_name, const std::string& source) override;
    void commit() override;

private:
    std::ostream& output_;
    std::mutex mutex_;
};
