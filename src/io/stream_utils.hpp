#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

// Copies the remainder of input to output. Throws std::runtime_error if either
// side fails; exceptions raised by the input's stream buffer propagate as-is.
uint64_t copy_stream(std::istream& input, std::ostream& output);

// Reads the remainder of input into memory.
std::vector<uint8_t> read_fully(std::istream& input);
