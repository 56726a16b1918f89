#pragma once

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

/* thrown when the input stream is closed or fails, the shell cannot
   recover from this and the process has to stop */
struct InputError : std::runtime_error {
  InputError(const std::string& what)
    : std::runtime_error{what}
  {};
};

struct InputBuffer {
  InputBuffer()
    : in{std::cin}
  {};

  InputBuffer(std::istream& input)
    : in{input}
  {};

  InputBuffer(const InputBuffer&)            = delete;
  InputBuffer& operator=(const InputBuffer&) = delete;

  /* blocks until a full line is available, strips one line terminator
     ("\n" or "\r\n") and nothing else */
  void read_input();

  std::optional<std::string> buffer;

private:
  std::istream& in;
};
