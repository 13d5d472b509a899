#pragma once

#include "decompiler.hpp"

// Decompiler that recovers declarations only: package, type header, fields and
// method signatures, with member classes resolved through the class cache.
// Method bodies are emitted as placeholders.
class ClassSkeletonDecompiler : public Decompiler {
public:
    explicit ClassSkeletonDecompiler(const DecompilerOptions& options);

    const DecompilerOptions& options() const override { return options_; }

    std::string decompile_class(const ClassCache& cache, const std::string& class_name) override;

private:
    DecompilerOptions options_;
};
