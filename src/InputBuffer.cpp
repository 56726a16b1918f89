#include "InputBuffer.hpp"

void InputBuffer::read_input() {
  std::string line;

  if (!std::getline(in, line))
    throw InputError("Error reading input");

  if (!line.empty() && line.back() == '\r')
    line.pop_back();

  buffer = std::move(line);
}
