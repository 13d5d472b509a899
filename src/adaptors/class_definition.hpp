#pragma once

#include "../classfile/class_file.hpp"
#include "../decompiler_options.hpp"
#include <ostream>
#include <set>
#include <string>

class ClassCache;
class JavaWriter;

// Renders a parsed class as a Java compilation unit: package, class header,
// fields and method signatures. Member classes are fetched from the cache and
// rendered inside their enclosing class.
class ClassDefinition {
public:
    ClassDefinition(const ClassFile& class_file, const ClassCache& cache, const DecompilerOptions& options);

    void write_to(std::ostream& output);

private:
    const ClassFile& class_file_;
    const ClassCache& cache_;
    const DecompilerOptions& options_;
    // Classes already rendered into the current compilation unit
    std::set<std::string> rendered_classes_;

    void write_file_header(JavaWriter& writer);
    void write_class(JavaWriter& writer, const ClassFile& class_file, uint16_t access_flags,
                     const std::string& display_name, int depth);
    void write_class_header(JavaWriter& writer, const ClassFile& class_file, uint16_t access_flags,
                            const std::string& display_name);
    void write_fields(JavaWriter& writer, const ClassFile& class_file);
    void write_methods(JavaWriter& writer, const ClassFile& class_file, const std::string& display_name);
    void write_member_classes(JavaWriter& writer, const ClassFile& class_file, int depth);
    std::string format_method(const ClassFile& class_file, const ClassMember& method, const std::string& display_name);
};
