#include "java_writer.hpp"
#include "../classfile/class_file.hpp"
#include <algorithm>

namespace {

constexpr char JAVA_LANG_PREFIX[] = "java/lang/";

std::string parse_type(const std::string& descriptor, std::size_t& pos) {
    std::size_t dimensions = 0;
    while (pos < descriptor.size() && descriptor[pos] == '[') {
        ++dimensions;
        ++pos;
    }
    if (pos >= descriptor.size()) {
        throw ClassFormatException("Truncated descriptor: " + descriptor);
    }

    std::string type;
    char c = descriptor[pos++];
    switch (c) {
        case 'B': type = "byte"; break;
        case 'C': type = "char"; break;
        case 'D': type = "double"; break;
        case 'F': type = "float"; break;
        case 'I': type = "int"; break;
        case 'J': type = "long"; break;
        case 'S': type = "short"; break;
        case 'Z': type = "boolean"; break;
        case 'V': type = "void"; break;
        case 'L': {
            std::size_t end = descriptor.find(';', pos);
            if (end == std::string::npos || end == pos) {
                throw ClassFormatException("Unterminated class type in descriptor: " + descriptor);
            }
            type = JavaWriter::java_name(descriptor.substr(pos, end - pos));
            pos = end + 1;
            break;
        }
        default:
            throw ClassFormatException(std::string("Unknown type '") + c + "' in descriptor: " + descriptor);
    }

    if (dimensions > 0 && type == "void") {
        throw ClassFormatException("Array of void in descriptor: " + descriptor);
    }
    for (std::size_t i = 0; i < dimensions; ++i) {
        type += "[]";
    }
    return type;
}

std::size_t parameters_end(const std::string& method_descriptor) {
    if (method_descriptor.empty() || method_descriptor[0] != '(') {
        throw ClassFormatException("Not a method descriptor: " + method_descriptor);
    }
    std::size_t end = method_descriptor.find(')');
    if (end == std::string::npos) {
        throw ClassFormatException("Unterminated method descriptor: " + method_descriptor);
    }
    return end;
}

} // namespace

JavaWriter::JavaWriter(std::ostream& output) : output_(output), indent_level_(0) {}

void JavaWriter::write_line(const std::string& text) {
    for (int i = 0; i < indent_level_; ++i) {
        output_ << "    ";
    }
    output_ << text << "\n";
}

void JavaWriter::write_comment(const std::string& comment) {
    write_line("// " + comment);
}

void JavaWriter::write_blank_line() {
    output_ << "\n";
}

void JavaWriter::indent() {
    indent_level_++;
}

void JavaWriter::dedent() {
    if (indent_level_ > 0) {
        indent_level_--;
    }
}

std::string JavaWriter::java_name(const std::string& binary_name) {
    std::string name = binary_name;
    const std::size_t prefix_length = sizeof(JAVA_LANG_PREFIX) - 1;
    if (name.compare(0, prefix_length, JAVA_LANG_PREFIX) == 0 &&
        name.find('/', prefix_length) == std::string::npos) {
        name = name.substr(prefix_length);
    }
    std::replace(name.begin(), name.end(), '/', '.');
    std::replace(name.begin(), name.end(), '$', '.');
    return name;
}

std::string JavaWriter::simple_name(const std::string& binary_name) {
    std::size_t start = binary_name.find_last_of("/$");
    return start == std::string::npos ? binary_name : binary_name.substr(start + 1);
}

std::string JavaWriter::package_name(const std::string& binary_name) {
    std::size_t end = binary_name.rfind('/');
    if (end == std::string::npos) {
        return "";
    }
    std::string package = binary_name.substr(0, end);
    std::replace(package.begin(), package.end(), '/', '.');
    return package;
}

std::string JavaWriter::field_type(const std::string& descriptor) {
    std::size_t pos = 0;
    std::string type = parse_type(descriptor, pos);
    if (pos != descriptor.size() || type == "void") {
        throw ClassFormatException("Invalid field descriptor: " + descriptor);
    }
    return type;
}

std::vector<std::string> JavaWriter::parameter_types(const std::string& method_descriptor) {
    std::size_t end = parameters_end(method_descriptor);
    std::vector<std::string> types;
    std::size_t pos = 1;
    while (pos < end) {
        std::string type = parse_type(method_descriptor, pos);
        if (type == "void" || pos > end) {
            throw ClassFormatException("Invalid parameter in method descriptor: " + method_descriptor);
        }
        types.push_back(type);
    }
    return types;
}

std::string JavaWriter::return_type(const std::string& method_descriptor) {
    std::size_t pos = parameters_end(method_descriptor) + 1;
    std::string type = parse_type(method_descriptor, pos);
    if (pos != method_descriptor.size()) {
        throw ClassFormatException("Trailing data in method descriptor: " + method_descriptor);
    }
    return type;
}

std::string JavaWriter::class_modifiers(uint16_t flags) {
    std::string result;
    if (flags & ACC_PUBLIC) result += "public ";
    if (flags & ACC_PRIVATE) result += "private ";
    if (flags & ACC_PROTECTED) result += "protected ";
    if (flags & ACC_STATIC) result += "static ";
    // Interfaces and enums carry implicit abstract/final
    if (!(flags & (ACC_INTERFACE | ACC_ENUM))) {
        if (flags & ACC_ABSTRACT) result += "abstract ";
        if (flags & ACC_FINAL) result += "final ";
    }
    return result;
}

std::string JavaWriter::field_modifiers(uint16_t flags) {
    std::string result;
    if (flags & ACC_PUBLIC) result += "public ";
    if (flags & ACC_PRIVATE) result += "private ";
    if (flags & ACC_PROTECTED) result += "protected ";
    if (flags & ACC_STATIC) result += "static ";
    if (flags & ACC_FINAL) result += "final ";
    if (flags & ACC_VOLATILE) result += "volatile ";
    if (flags & ACC_TRANSIENT) result += "transient ";
    return result;
}

std::string JavaWriter::method_modifiers(uint16_t flags) {
    std::string result;
    if (flags & ACC_PUBLIC) result += "public ";
    if (flags & ACC_PRIVATE) result += "private ";
    if (flags & ACC_PROTECTED) result += "protected ";
    if (flags & ACC_STATIC) result += "static ";
    if (flags & ACC_FINAL) result += "final ";
    if (flags & ACC_SYNCHRONIZED) result += "synchronized ";
    if (flags & ACC_NATIVE) result += "native ";
    if (flags & ACC_ABSTRACT) result += "abstract ";
    if (flags & ACC_STRICT) result += "strictfp ";
    return result;
}
