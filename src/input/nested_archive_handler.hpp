#pragma once

#include "../output/output_sink.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

class Decompiler;

// Stages a nested archive entry in a temp file and runs a child pipeline over it.
class NestedArchiveHandler {
public:
    NestedArchiveHandler(Decompiler& decompiler, OutputFactory output_factory);

    // Decompiles the archive read from input into a sink scoped to
    // output_scope + ".src". Failures are logged, never thrown; the temp file
    // is gone by the time this returns. Returns true if the nested run opened
    // its archive and completed.
    bool process(std::istream& input, const std::filesystem::path& output_scope);

    // Scope for a nested entry: <parent target dir>/<entry name>, or just the
    // entry name when the parent sink has no directory. std::nullopt for names
    // that are empty, absolute or lead out of the parent scope.
    static std::optional<std::filesystem::path> inner_scope(const OutputSink& parent, const std::string& entry_name);

private:
    Decompiler& decompiler_;
    OutputFactory output_factory_;
};
