#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// Indenting writer for Java declaration skeletons plus the descriptor and
// modifier formatting they need.
class JavaWriter {
public:
    explicit JavaWriter(std::ostream& output);

    void write_line(const std::string& text);
    void write_comment(const std::string& comment);
    void write_blank_line();

    // Indentation
    void indent();
    void dedent();

    // Binary name formatting: "java/util/Map$Entry" -> "java.util.Map.Entry"
    static std::string java_name(const std::string& binary_name);
    static std::string simple_name(const std::string& binary_name);
    static std::string package_name(const std::string& binary_name);

    // Descriptor formatting; malformed descriptors throw ClassFormatException
    static std::string field_type(const std::string& descriptor);
    static std::vector<std::string> parameter_types(const std::string& method_descriptor);
    static std::string return_type(const std::string& method_descriptor);

    // Modifier keywords, each followed by a space
    static std::string class_modifiers(uint16_t flags);
    static std::string field_modifiers(uint16_t flags);
    static std::string method_modifiers(uint16_t flags);

private:
    std::ostream& output_;
    int indent_level_;
};
