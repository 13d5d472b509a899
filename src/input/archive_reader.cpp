#include "archive_reader.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <iostream>
#include <utility>

namespace {

constexpr std::size_t ENTRY_BUFFER_SIZE = 64 * 1024;
constexpr std::size_t OPEN_BLOCK_SIZE = 10240;

std::string archive_error(struct archive* archive) {
    const char* message = archive_error_string(archive);
    return message ? message : "unknown archive error";
}

} // namespace

ArchiveEntryBuffer::ArchiveEntryBuffer(struct archive* archive)
    : archive_(archive), buffer_(ENTRY_BUFFER_SIZE) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

ArchiveEntryBuffer::int_type ArchiveEntryBuffer::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    auto count = archive_read_data(archive_, buffer_.data(), buffer_.size());
    if (count < 0) {
        throw EntryReadException(archive_error(archive_));
    }
    if (count == 0) {
        return traits_type::eof();
    }

    setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
    return traits_type::to_int_type(*gptr());
}

ArchiveEntryStream::ArchiveEntryStream(struct archive* archive)
    : std::istream(nullptr), buffer_(archive) {
    rdbuf(&buffer_);
    exceptions(std::ios::badbit);
}

std::unique_ptr<ArchiveReader> ArchiveReader::open(const std::string& filename) {
    struct archive* archive = archive_read_new();
    if (!archive) {
        std::cerr << "Error: Cannot allocate archive reader" << std::endl;
        return nullptr;
    }

    archive_read_support_filter_all(archive);
    archive_read_support_format_zip(archive);

    if (archive_read_open_filename(archive, filename.c_str(), OPEN_BLOCK_SIZE) != ARCHIVE_OK) {
        std::cerr << "Error: Cannot open archive: " << filename << " (" << archive_error(archive) << ")" << std::endl;
        archive_read_free(archive);
        return nullptr;
    }

    return std::unique_ptr<ArchiveReader>(new ArchiveReader(archive, filename));
}

ArchiveReader::ArchiveReader(struct archive* archive, std::string filename)
    : archive_(archive), filename_(std::move(filename)) {}

ArchiveReader::~ArchiveReader() {
    entry_stream_.reset();
    archive_read_close(archive_);
    archive_read_free(archive_);
}

bool ArchiveReader::next_entry(ArchiveEntry& entry) {
    entry_stream_.reset();

    struct archive_entry* header = nullptr;
    int status = archive_read_next_header(archive_, &header);
    if (status == ARCHIVE_EOF) {
        return false;
    }
    if (status < ARCHIVE_WARN) {
        throw EntryReadException(archive_error(archive_));
    }
    if (status == ARCHIVE_WARN) {
        std::cerr << "Warning: " << filename_ << ": " << archive_error(archive_) << std::endl;
    }

    const char* pathname = archive_entry_pathname(header);
    entry.name = pathname ? pathname : "";
    entry.is_directory = archive_entry_filetype(header) == AE_IFDIR ||
                         (!entry.name.empty() && entry.name.back() == '/');

    entry_stream_ = std::make_unique<ArchiveEntryStream>(archive_);
    return true;
}

std::istream& ArchiveReader::entry_data() {
    if (!entry_stream_) {
        throw EntryReadException("No current entry in " + filename_);
    }
    return *entry_stream_;
}
