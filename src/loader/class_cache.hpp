#pragma once

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

class LoaderException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// In-memory store of class bytecode keyed by binary name (e.g. "com/acme/Foo",
// no ".class" suffix). Filled sequentially while an archive is scanned and only
// read afterwards, so concurrent lookups during dispatch need no locking.
class ClassCache {
public:
    // Buffers the whole stream under class_name. If the stream cannot be read
    // to the end a LoaderException is thrown and the cache is left unchanged.
    // Adding an existing name replaces its bytes but keeps its first position.
    void add_class(const std::string& class_name, std::istream& input);

    // Names in insertion order.
    const std::vector<std::string>& class_names() const { return class_names_; }

    // Returns nullptr when the class is not cached.
    const std::vector<uint8_t>* lookup(const std::string& class_name) const;

    bool contains(const std::string& class_name) const { return classes_.count(class_name) != 0; }
    std::size_t size() const { return class_names_.size(); }
    bool empty() const { return class_names_.empty(); }

private:
    std::unordered_map<std::string, std::vector<uint8_t>> classes_;
    std::vector<std::string> class_names_;
};
