#include "class_definition.hpp"
#include "../formatter/java_writer.hpp"
#include "../loader/class_cache.hpp"
#include <iostream>

namespace {

constexpr int MAX_MEMBER_CLASS_DEPTH = 16;
constexpr char METHOD_BODY[] = " { /* compiled code */ }";

std::string join(const std::vector<std::string>& values, const char* separator) {
    std::string result;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += values[i];
    }
    return result;
}

bool is_hidden(uint16_t access_flags) {
    return (access_flags & ACC_SYNTHETIC) != 0;
}

} // namespace

ClassDefinition::ClassDefinition(const ClassFile& class_file, const ClassCache& cache, const DecompilerOptions& options)
    : class_file_(class_file), cache_(cache), options_(options) {}

void ClassDefinition::write_to(std::ostream& output) {
    JavaWriter writer(output);
    rendered_classes_.clear();
    rendered_classes_.insert(class_file_.class_name());

    write_file_header(writer);
    write_class(writer, class_file_, class_file_.access_flags(),
                JavaWriter::simple_name(class_file_.class_name()), 0);
}

void ClassDefinition::write_file_header(JavaWriter& writer) {
    if (!class_file_.source_file().empty()) {
        writer.write_comment("Source File: " + class_file_.source_file());
    }
    writer.write_comment("Class Version: " + std::to_string(class_file_.major_version()) + "." +
                         std::to_string(class_file_.minor_version()));

    std::string package = JavaWriter::package_name(class_file_.class_name());
    if (!package.empty()) {
        writer.write_line("package " + package + ";");
    }
    writer.write_blank_line();
}

void ClassDefinition::write_class(JavaWriter& writer, const ClassFile& class_file, uint16_t access_flags,
                                  const std::string& display_name, int depth) {
    write_class_header(writer, class_file, access_flags, display_name);
    writer.indent();

    write_fields(writer, class_file);
    write_methods(writer, class_file, display_name);
    write_member_classes(writer, class_file, depth);

    writer.dedent();
    writer.write_line("}");
}

void ClassDefinition::write_class_header(JavaWriter& writer, const ClassFile& class_file, uint16_t access_flags,
                                         const std::string& display_name) {
    std::string header = JavaWriter::class_modifiers(access_flags);
    std::vector<std::string> interfaces;
    for (const auto& interface : class_file.interfaces()) {
        interfaces.push_back(JavaWriter::java_name(interface));
    }

    if (access_flags & ACC_ANNOTATION) {
        header += "@interface " + display_name;
    } else if (access_flags & ACC_INTERFACE) {
        header += "interface " + display_name;
        if (!interfaces.empty()) {
            header += " extends " + join(interfaces, ", ");
        }
    } else {
        header += ((access_flags & ACC_ENUM) ? "enum " : "class ") + display_name;

        const std::string& super_class = class_file.super_class_name();
        if (!(access_flags & ACC_ENUM) && !super_class.empty() && super_class != "java/lang/Object") {
            header += " extends " + JavaWriter::java_name(super_class);
        }
        if (!interfaces.empty()) {
            header += " implements " + join(interfaces, ", ");
        }
    }

    writer.write_line(header + " {");
}

void ClassDefinition::write_fields(JavaWriter& writer, const ClassFile& class_file) {
    bool wrote_any = false;
    for (const auto& field : class_file.fields()) {
        if (is_hidden(field.access_flags)) {
            continue;
        }
        if (!wrote_any) {
            writer.write_blank_line();
            wrote_any = true;
        }
        writer.write_line(JavaWriter::field_modifiers(field.access_flags) +
                          JavaWriter::field_type(field.descriptor) + " " + field.name + ";");
    }
}

void ClassDefinition::write_methods(JavaWriter& writer, const ClassFile& class_file, const std::string& display_name) {
    for (const auto& method : class_file.methods()) {
        if (is_hidden(method.access_flags) || (method.access_flags & ACC_BRIDGE)) {
            continue;
        }
        writer.write_blank_line();
        writer.write_line(format_method(class_file, method, display_name));
    }
}

std::string ClassDefinition::format_method(const ClassFile& class_file, const ClassMember& method,
                                           const std::string& display_name) {
    if (method.name == "<clinit>") {
        return std::string("static") + METHOD_BODY;
    }

    uint16_t flags = method.access_flags;
    bool in_interface = (class_file.access_flags() & ACC_INTERFACE) != 0;
    if (in_interface) {
        flags &= static_cast<uint16_t>(~(ACC_PUBLIC | ACC_ABSTRACT));
    }

    std::string text = JavaWriter::method_modifiers(flags);
    if (in_interface && !(method.access_flags & (ACC_ABSTRACT | ACC_STATIC | ACC_PRIVATE))) {
        text += "default ";
    }

    if (method.name == "<init>") {
        text += display_name;
    } else {
        text += JavaWriter::return_type(method.descriptor) + " " + method.name;
    }

    std::vector<std::string> parameters = JavaWriter::parameter_types(method.descriptor);
    std::vector<std::string> declarations;
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        std::string type = parameters[i];
        bool is_last = i + 1 == parameters.size();
        if (is_last && (method.access_flags & ACC_VARARGS) && type.size() > 2 &&
            type.compare(type.size() - 2, 2, "[]") == 0) {
            type = type.substr(0, type.size() - 2) + "...";
        }
        declarations.push_back(type + " arg" + std::to_string(i));
    }
    text += "(" + join(declarations, ", ") + ")";

    if (!method.exceptions.empty()) {
        std::vector<std::string> exceptions;
        for (const auto& exception : method.exceptions) {
            exceptions.push_back(JavaWriter::java_name(exception));
        }
        text += " throws " + join(exceptions, ", ");
    }

    if (method.access_flags & (ACC_ABSTRACT | ACC_NATIVE)) {
        return text + ";";
    }
    return text + METHOD_BODY;
}

void ClassDefinition::write_member_classes(JavaWriter& writer, const ClassFile& class_file, int depth) {
    for (const auto& inner : class_file.inner_classes()) {
        // Only named members declared directly in this class
        if (inner.outer_class != class_file.class_name() || inner.inner_name.empty() ||
            is_hidden(inner.access_flags)) {
            continue;
        }

        writer.write_blank_line();

        if (depth + 1 > MAX_MEMBER_CLASS_DEPTH) {
            writer.write_comment("Member class " + inner.inner_class + " nested too deeply");
            continue;
        }

        // A member list may name the enclosing class, or one class several times
        if (!rendered_classes_.insert(inner.inner_class).second) {
            writer.write_comment("Member class " + inner.inner_class + " is already declared");
            continue;
        }

        const std::vector<uint8_t>* bytes = cache_.lookup(inner.inner_class);
        if (!bytes) {
            if (options_.verbose) {
                std::cout << "Member class " << inner.inner_class << " of " << class_file.class_name()
                          << " not found in archive" << std::endl;
            }
            writer.write_comment("Member class " + inner.inner_class + " is not in this archive");
            continue;
        }

        try {
            auto member_class = ClassFile::parse(*bytes);
            write_class(writer, *member_class, inner.access_flags, inner.inner_name, depth + 1);
        } catch (const ClassFormatException& e) {
            writer.write_comment("Member class " + inner.inner_class + " is malformed: " + e.what());
        }
    }
}
