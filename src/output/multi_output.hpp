#pragma once

#include "output_sink.hpp"
#include <memory>
#include <vector>

// Forwards every call to each child sink in order.
class MultiOutput : public OutputSink {
public:
    explicit MultiOutput(std::vector<std::unique_ptr<OutputSink>> outputs);

    void init(const DecompilerOptions& options, const std::string& archive_path) override;
    void process_resource(const std::string& entry_name, std::istream& data) override;
    void process_class(const std::string& class_name, const std::string& source) override;
    void commit() override;

    // First child target directory.
    std::optional<std::filesystem::path> target_dir() const override;

private:
    std::vector<std::unique_ptr<OutputSink>> outputs_;
};
