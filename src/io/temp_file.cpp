#include "temp_file.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <system_error>
#include <vector>
#include <unistd.h>

TempFile::TempFile(const std::filesystem::path& directory, const std::string& prefix, const std::string& suffix) {
    std::filesystem::path base = directory;
    if (base.empty()) {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            throw TempFileException("Cannot determine temp directory: " + ec.message());
        }
    }

    std::string name_template = (base / (prefix + "XXXXXX" + suffix)).string();
    std::vector<char> buffer(name_template.begin(), name_template.end());
    buffer.push_back('\0');

    int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw TempFileException("Cannot create temp file in " + base.string() + ": " + std::strerror(errno));
    }
    ::close(fd);

    path_ = buffer.data();
}

TempFile::~TempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        std::cerr << "Warning: Cannot delete temp file " << path_ << ": " << ec.message() << std::endl;
    }
}
