#include "archive_scanner.hpp"
#include "archive_reader.hpp"
#include "nested_archive_handler.hpp"
#include "../loader/class_cache.hpp"
#include "../output/output_sink.hpp"
#include <iostream>

ArchiveScanner::ArchiveScanner(const DecompilerOptions& options, ClassCache& cache, OutputSink& output,
                               NestedArchiveHandler& nested_handler)
    : options_(options), classifier_(options), cache_(cache), output_(output), nested_handler_(nested_handler) {}

ScanResult ArchiveScanner::scan(const std::string& archive_path) {
    ScanResult result;

    auto reader = ArchiveReader::open(archive_path);
    if (!reader) {
        result.status = ScanStatus::open_failed;
        return result;
    }

    if (options_.verbose) {
        std::cout << "Scanning " << archive_path << std::endl;
    }

    try {
        ArchiveEntry entry;
        while (reader->next_entry(entry)) {
            if (entry.is_directory) {
                continue;
            }

            EntryCategory category = classifier_.classify(entry.name);
            switch (category) {
                case EntryCategory::class_file:
                    if (process_class(entry.name, reader->entry_data())) {
                        result.classes++;
                    } else {
                        result.class_failures++;
                    }
                    break;
                case EntryCategory::nested_archive:
                    if (process_nested_archive(entry.name, reader->entry_data())) {
                        result.nested_archives++;
                    } else {
                        result.nested_failures++;
                    }
                    break;
                case EntryCategory::resource:
                    if (process_resource(entry.name, reader->entry_data())) {
                        result.resources++;
                    } else {
                        result.resource_failures++;
                    }
                    break;
                case EntryCategory::skipped:
                    if (options_.verbose) {
                        std::cout << "Skipping " << entry.name << std::endl;
                    }
                    result.skipped++;
                    break;
            }
        }
    } catch (const EntryReadException& e) {
        std::cerr << "Error: Archive " << archive_path << " is unreadable: " << e.what() << std::endl;
        result.status = ScanStatus::truncated;
    }

    return result;
}

bool ArchiveScanner::process_class(const std::string& entry_name, std::istream& data) {
    std::string class_name = cut_class_suffix(entry_name);
    if (options_.verbose) {
        std::cout << "Caching " << class_name << std::endl;
    }

    try {
        cache_.add_class(class_name, data);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: Cannot cache class " << entry_name << ": " << e.what() << std::endl;
        return false;
    }
}

bool ArchiveScanner::process_nested_archive(const std::string& entry_name, std::istream& data) {
    if (options_.verbose) {
        std::cout << "Processing nested archive " << entry_name << std::endl;
    }

    auto scope = NestedArchiveHandler::inner_scope(output_, entry_name);
    if (!scope) {
        std::cerr << "Error: Nested archive " << entry_name << " escapes the output directory" << std::endl;
        return false;
    }
    return nested_handler_.process(data, *scope);
}

bool ArchiveScanner::process_resource(const std::string& entry_name, std::istream& data) {
    if (options_.verbose) {
        std::cout << "Processing resource " << entry_name << std::endl;
    }

    try {
        output_.process_resource(entry_name, data);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: Cannot process resource " << entry_name << ": " << e.what() << std::endl;
        return false;
    }
}
