#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

class TempFileException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Uniquely named file that is removed when the owner goes out of scope.
class TempFile {
public:
    // Creates <directory>/<prefix>XXXXXX<suffix>. An empty directory means the
    // system temp directory. Throws TempFileException on failure.
    TempFile(const std::filesystem::path& directory, const std::string& prefix, const std::string& suffix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};
