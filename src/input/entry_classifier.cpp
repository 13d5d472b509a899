#include "entry_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

constexpr char CLASS_SUFFIX[] = ".class";
constexpr char INNER_CLASS_SEPARATOR = '$';

bool ends_with(const std::string& value, const std::string& suffix, bool ignore_case) {
    if (value.size() < suffix.size()) {
        return false;
    }
    return std::equal(suffix.begin(), suffix.end(), value.end() - suffix.size(),
                      [ignore_case](char a, char b) {
                          if (!ignore_case) {
                              return a == b;
                          }
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

std::optional<std::regex> compile_pattern(const std::string& pattern, const char* what) {
    if (pattern.empty()) {
        return std::nullopt;
    }
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument(std::string("Invalid ") + what + " pattern '" + pattern + "': " + e.what());
    }
}

} // namespace

const char* to_string(EntryCategory category) {
    switch (category) {
        case EntryCategory::class_file: return "class";
        case EntryCategory::nested_archive: return "nested archive";
        case EntryCategory::resource: return "resource";
        case EntryCategory::skipped: return "skipped";
    }
    return "unknown";
}

bool is_class_file(const std::string& entry_name) {
    return entry_name.size() > sizeof(CLASS_SUFFIX) - 1 && ends_with(entry_name, CLASS_SUFFIX, false);
}

bool is_archive_file(const std::string& entry_name) {
    return ends_with(entry_name, ".jar", true) ||
           ends_with(entry_name, ".war", true) ||
           ends_with(entry_name, ".ear", true) ||
           ends_with(entry_name, ".zip", true);
}

bool is_inner_class(const std::string& class_name) {
    return class_name.find(INNER_CLASS_SEPARATOR) != std::string::npos;
}

std::string cut_class_suffix(const std::string& entry_name) {
    if (!ends_with(entry_name, CLASS_SUFFIX, false)) {
        return entry_name;
    }
    return entry_name.substr(0, entry_name.size() - (sizeof(CLASS_SUFFIX) - 1));
}

EntryClassifier::EntryClassifier(const DecompilerOptions& options)
    : skip_resources_(options.skip_resources),
      decompile_inner_jars_(options.decompile_inner_jars),
      include_pattern_(compile_pattern(options.include_pattern, "include")),
      exclude_pattern_(compile_pattern(options.exclude_pattern, "exclude")) {}

bool EntryClassifier::skip_path(const std::string& entry_name) const {
    if (exclude_pattern_ && std::regex_match(entry_name, *exclude_pattern_)) {
        return true;
    }
    if (include_pattern_ && !std::regex_match(entry_name, *include_pattern_)) {
        return true;
    }
    return false;
}

EntryCategory EntryClassifier::classify(const std::string& entry_name) const {
    if (skip_path(entry_name)) {
        return EntryCategory::skipped;
    }
    if (is_class_file(entry_name)) {
        return EntryCategory::class_file;
    }
    if (decompile_inner_jars_ && is_archive_file(entry_name)) {
        return EntryCategory::nested_archive;
    }
    return skip_resources_ ? EntryCategory::skipped : EntryCategory::resource;
}
