#include "print_stream_output.hpp"

namespace {

constexpr char RULE[] = "//------------------------------------------------------------------------------";

} // namespace

PrintStreamOutput::PrintStreamOutput(std::ostream& output) : output_(output) {}

void PrintStreamOutput::init(const DecompilerOptions&, const std::string&) {}

void PrintStreamOutput::process_resource(const std::string&, std::istream&) {}

void PrintStreamOutput::process_class(const std::string& class_name, const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ << RULE << "\n"
            << "// Class " << class_name << "\n"
            << RULE << "\n"
            << source;
    if (!source.empty() && source.back() != '\n') {
        output_ << "\n";
    }
    output_ << "\n";
}

void PrintStreamOutput::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    output_.flush();
}
