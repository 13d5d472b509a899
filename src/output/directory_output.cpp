#include "directory_output.hpp"
#include "../io/stream_utils.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace {

constexpr char JAVA_SUFFIX[] = ".java";

} // namespace

DirectoryOutput::DirectoryOutput(std::filesystem::path directory) : directory_(std::move(directory)) {}

void DirectoryOutput::init(const DecompilerOptions& options, const std::string& archive_path) {
    verbose_ = options.verbose;
    try {
        std::filesystem::create_directories(directory_);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to create output directory " + directory_.string() + ": " + e.what());
    }

    if (verbose_) {
        std::cout << "Writing " << archive_path << " to " << directory_.string() << std::endl;
    }
}

void DirectoryOutput::process_resource(const std::string& entry_name, std::istream& data) {
    auto full_path = resolve(entry_name);
    create_parent_directories(full_path);

    std::ofstream output(full_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot create output file: " + full_path.string());
    }
    try {
        copy_stream(data, output);
    } catch (const std::exception&) {
        output.close();
        std::error_code ec;
        std::filesystem::remove(full_path, ec);
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    resource_count_++;
}

void DirectoryOutput::process_class(const std::string& class_name, const std::string& source) {
    auto full_path = resolve(class_name + JAVA_SUFFIX);
    create_parent_directories(full_path);

    std::ofstream output(full_path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot create output file: " + full_path.string());
    }
    output << source;
    output.flush();
    if (!output) {
        throw std::runtime_error("Cannot write output file: " + full_path.string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    class_count_++;
}

void DirectoryOutput::commit() {
    if (verbose_) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "Wrote " << class_count_ << " classes and " << resource_count_
                  << " resources to " << directory_.string() << std::endl;
    }
}

std::size_t DirectoryOutput::class_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return class_count_;
}

std::size_t DirectoryOutput::resource_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resource_count_;
}

std::filesystem::path DirectoryOutput::resolve(const std::string& relative_name) const {
    std::filesystem::path relative = std::filesystem::path(relative_name).lexically_normal();
    if (relative.empty() || relative.is_absolute() || relative.has_root_path() ||
        *relative.begin() == "..") {
        throw std::runtime_error("Entry name escapes output directory: " + relative_name);
    }
    return directory_ / relative;
}

void DirectoryOutput::create_parent_directories(const std::filesystem::path& file_path) {
    // create_directories tolerates concurrent creation of the same tree
    std::error_code ec;
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + file_path.parent_path().string() + ": " + ec.message());
    }
}

std::unique_ptr<OutputSink> make_directory_output(const std::filesystem::path& directory) {
    return std::make_unique<DirectoryOutput>(directory);
}
