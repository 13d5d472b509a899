#pragma once

#include <istream>
#include <memory>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

struct archive;

class EntryReadException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ArchiveEntry {
    std::string name;
    bool is_directory = false;
};

// Stream buffer over the data of the archive's current entry.
class ArchiveEntryBuffer : public std::streambuf {
public:
    explicit ArchiveEntryBuffer(struct archive* archive);

protected:
    int_type underflow() override;

private:
    struct archive* archive_;
    std::vector<char> buffer_;
};

// Read failures are raised as EntryReadException (badbit is in the exception mask).
class ArchiveEntryStream : public std::istream {
public:
    explicit ArchiveEntryStream(struct archive* archive);

private:
    ArchiveEntryBuffer buffer_;
};

// Forward-only reader over a zip-family archive. Entries come in container order
// and the stream returned by entry_data() is invalidated by the next call to
// next_entry().
class ArchiveReader {
public:
    // Returns nullptr if the file is missing or is not a readable archive.
    static std::unique_ptr<ArchiveReader> open(const std::string& filename);

    ~ArchiveReader();

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    // Advances to the next entry. Returns false at the end of the archive and
    // throws EntryReadException when the container is corrupt or truncated.
    bool next_entry(ArchiveEntry& entry);

    std::istream& entry_data();

private:
    ArchiveReader(struct archive* archive, std::string filename);

    struct archive* archive_;
    std::string filename_;
    std::unique_ptr<ArchiveEntryStream> entry_stream_;
};
