#pragma once

#include "../decompiler_options.hpp"
#include <stdexcept>
#include <string>

class ClassCache;

class DecompileException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Turns one cached class into source text. The cache is the resolution context:
// any class referenced by class_name (inner classes, supertypes) may be looked up
// in it. Implementations must allow concurrent decompile_class() calls.
class Decompiler {
public:
    virtual ~Decompiler() = default;

    virtual const DecompilerOptions& options() const = 0;

    // Throws DecompileException if class_name cannot be decompiled.
    virtual std::string decompile_class(const ClassCache& cache, const std::string& class_name) = 0;
};
