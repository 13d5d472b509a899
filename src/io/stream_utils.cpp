#include "stream_utils.hpp"
#include <array>
#include <stdexcept>

namespace {

constexpr std::size_t COPY_BUFFER_SIZE = 64 * 1024;

template <typename Sink>
uint64_t drain(std::istream& input, Sink&& sink) {
    std::array<char, COPY_BUFFER_SIZE> buffer;
    uint64_t total = 0;

    while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
        auto count = input.gcount();
        sink(buffer.data(), count);
        total += static_cast<uint64_t>(count);
    }

    if (input.bad()) {
        throw std::runtime_error("Input stream failed after " + std::to_string(total) + " bytes");
    }
    return total;
}

} // namespace

uint64_t copy_stream(std::istream& input, std::ostream& output) {
    uint64_t total = drain(input, [&output](const char* data, std::streamsize count) {
        output.write(data, count);
        if (!output) {
            throw std::runtime_error("Output stream rejected write");
        }
    });
    output.flush();
    if (!output) {
        throw std::runtime_error("Output stream flush failed");
    }
    return total;
}

std::vector<uint8_t> read_fully(std::istream& input) {
    std::vector<uint8_t> bytes;
    drain(input, [&bytes](const char* data, std::streamsize count) {
        bytes.insert(bytes.end(),
                     reinterpret_cast<const uint8_t*>(data),
                     reinterpret_cast<const uint8_t*>(data) + count);
    });
    return bytes;
}
