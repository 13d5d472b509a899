#include "multi_output.hpp"
#include "../io/stream_utils.hpp"
#include <sstream>
#include <stdexcept>

MultiOutput::MultiOutput(std::vector<std::unique_ptr<OutputSink>> outputs) : outputs_(std::move(outputs)) {
    for (const auto& output : outputs_) {
        if (!output) {
            throw std::invalid_argument("MultiOutput does not accept null outputs");
        }
    }
}

void MultiOutput::init(const DecompilerOptions& options, const std::string& archive_path) {
    for (auto& output : outputs_) {
        output->init(options, archive_path);
    }
}

void MultiOutput::process_resource(const std::string& entry_name, std::istream& data) {
    if (outputs_.size() == 1) {
        outputs_.front()->process_resource(entry_name, data);
        return;
    }

    // Entry streams are single pass; each child reads its own copy
    std::ostringstream buffered;
    copy_stream(data, buffered);
    const std::string content = buffered.str();

    for (auto& output : outputs_) {
        std::istringstream copy(content);
        output->process_resource(entry_name, copy);
    }
}

void MultiOutput::process_class(const std::string& class_name, const std::string& source) {
    for (auto& output : outputs_) {
        output->process_class(class_name, source);
    }
}

void MultiOutput::commit() {
    for (auto& output : outputs_) {
        output->commit();
    }
}

std::optional<std::filesystem::path> MultiOutput::target_dir() const {
    for (const auto& output : outputs_) {
        auto dir = output->target_dir();
        if (dir) {
            return dir;
        }
    }
    return std::nullopt;
}
