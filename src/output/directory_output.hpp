#pragma once

#include "output_sink.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>

// Writes each class to <directory>/<binary name>.java and each resource to
// <directory>/<entry name>.
class DirectoryOutput : public OutputSink {
public:
    explicit DirectoryOutput(std::filesystem::path directory);

    void init(const DecompilerOptions& options, const std::string& archive_path) override;
    void process_resource(const std::string& entry_name, std::istream& data) override;
    void process_class(const std::string& class_name, const std::string& source) override;
    void commit() override;

    std::optional<std::filesystem::path> target_dir() const override { return directory_; }

    std::size_t class_count() const;
    std::size_t resource_count() const;

private:
    // Throws std::runtime_error for names that would land outside directory_.
    std::filesystem::path resolve(const std::string& relative_name) const;
    void create_parent_directories(const std::filesystem::path& file_path);

    std::filesystem::path directory_;
    bool verbose_ = false;
    mutable std::mutex mutex_;
    std::size_t class_count_ = 0;
    std::size_t resource_count_ = 0;
};

std::unique_ptr<OutputSink> make_directory_output(const std::filesystem::path& directory);
