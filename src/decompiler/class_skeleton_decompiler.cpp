#include "class_skeleton_decompiler.hpp"
#include "../adaptors/class_definition.hpp"
#include "../classfile/class_file.hpp"
#include "../loader/class_cache.hpp"
#include <iostream>
#include <sstream>

ClassSkeletonDecompiler::ClassSkeletonDecompiler(const DecompilerOptions& options) : options_(options) {}

std::string ClassSkeletonDecompiler::decompile_class(const ClassCache& cache, const std::string& class_name) {
    const std::vector<uint8_t>* bytes = cache.lookup(class_name);
    if (!bytes) {
        throw DecompileException("Class " + class_name + " is not in the class cache");
    }

    try {
        auto class_file = ClassFile::parse(*bytes);
        if (class_file->class_name() != class_name && options_.verbose) {
            std::cout << "Entry " << class_name << " declares class " << class_file->class_name() << std::endl;
        }

        std::ostringstream output;
        ClassDefinition definition(*class_file, cache, options_);
        definition.write_to(output);
        return output.str();
    } catch (const ClassFormatException& e) {
        throw DecompileException("Malformed class " + class_name + ": " + e.what());
    }
}
