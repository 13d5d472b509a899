#pragma once

#include "../decompiler_options.hpp"
#include <optional>
#include <regex>
#include <string>

enum class EntryCategory {
    class_file,
    nested_archive,
    resource,
    skipped
};

const char* to_string(EntryCategory category);

// Entry name helpers
bool is_class_file(const std::string& entry_name);
bool is_archive_file(const std::string& entry_name); // jar, war, ear or zip
bool is_inner_class(const std::string& class_name);
std::string cut_class_suffix(const std::string& entry_name);

// Maps an archive entry name to what the scanner should do with it. Checks run
// in a fixed order: path filters, class file, nested archive, resource.
class EntryClassifier {
public:
    // Throws std::invalid_argument if a configured pattern is not a valid regex.
    explicit EntryClassifier(const DecompilerOptions& options);

    EntryCategory classify(const std::string& entry_name) const;

    bool skip_path(const std::string& entry_name) const;

private:
    bool skip_resources_;
    bool decompile_inner_jars_;
    std::optional<std::regex> include_pattern_;
    std::optional<std::regex> exclude_pattern_;
};
