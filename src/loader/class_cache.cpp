#include "class_cache.hpp"
#include "../io/stream_utils.hpp"

void ClassCache::add_class(const std::string& class_name, std::istream& input) {
    if (class_name.empty()) {
        throw LoaderException("Cannot cache a class without a name");
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = read_fully(input);
    } catch (const std::exception& e) {
        throw LoaderException("Cannot read class " + class_name + ": " + e.what());
    }

    auto it = classes_.find(class_name);
    if (it != classes_.end()) {
        it->second = std::move(bytes);
        return;
    }

    classes_.emplace(class_name, std::move(bytes));
    class_names_.push_back(class_name);
}

const std::vector<uint8_t>* ClassCache::lookup(const std::string& class_name) const {
    auto it = classes_.find(class_name);
    if (it == classes_.end()) {
        return nullptr;
    }
    return &it->second;
}
