#pragma once

#include "class_structures.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class ClassFormatException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Declarations of a parsed JVM class file. Method bodies are not decoded.
class ClassFile {
public:
    // Throws ClassFormatException for truncated or malformed input.
    static std::unique_ptr<ClassFile> parse(const std::vector<uint8_t>& data);

    uint16_t major_version() const { return major_version_; }
    uint16_t minor_version() const { return minor_version_; }
    uint16_t access_flags() const { return access_flags_; }

    // Binary names, e.g. "com/acme/Foo"
    const std::string& class_name() const { return class_name_; }
    const std::string& super_class_name() const { return super_class_name_; }
    const std::vector<std::string>& interfaces() const { return interfaces_; }

    const std::vector<ClassMember>& fields() const { return fields_; }
    const std::vector<ClassMember>& methods() const { return methods_; }
    const std::vector<InnerClassInfo>& inner_classes() const { return inner_classes_; }
    const std::string& source_file() const { return source_file_; }

private:
    class Reader;

    ClassFile() = default;

    void parse_constant_pool(Reader& reader);
    void parse_members(Reader& reader, std::vector<ClassMember>& members, bool is_method);
    void parse_class_attributes(Reader& reader);
    void parse_inner_classes(Reader& reader);

    const ConstantPoolEntry& constant(uint16_t index, uint8_t expected_tag) const;
    const std::string& get_utf8(uint16_t index) const;
    std::string get_class_name(uint16_t index) const;

    uint16_t minor_version_ = 0;
    uint16_t major_version_ = 0;
    uint16_t access_flags_ = 0;
    std::vector<ConstantPoolEntry> constant_pool_;
    std::string class_name_;
    std::string super_class_name_;
    std::vector<std::string> interfaces_;
    std::vector<ClassMember> fields_;
    std::vector<ClassMember> methods_;
    std::vector<InnerClassInfo> inner_classes_;
    std::string source_file_;
};
