#pragma once

#include <cstdlib>

#include <iostream>

#include "CommandRunner.hpp"
#include "InputBuffer.hpp"
#include "Util.hpp"

struct Shell {
  Shell(const Shell&)            = delete;
  Shell(Shell&&)                 = delete;
  Shell& operator=(const Shell&) = delete;
  Shell& operator=(Shell&&)      = delete;

  Shell(const DbDetails& db_details)
    : Shell{db_details, std::cin, std::cout, std::cerr}
  {};

  Shell(const DbDetails& db_details,
        std::istream&    input,
        std::ostream&    output,
        std::ostream&    error)
    : details{db_details}, input_buffer{input}, runner{output, error}, out{output}, err{error}
  {};

  /* runs until '.exit' and returns EXIT_SUCCESS, an InputError from a
     closed or broken input stream is passed on to the caller */
  int start_cmdline();

  /* start_cmdline() with the InputError reported on the error stream,
     returns the process exit status */
  int run();

  void print_db_details();
  void print_prompt();

private:
  DbDetails     details;
  InputBuffer   input_buffer;
  CommandRunner runner;
  Command       command;
  std::ostream& out;
  std::ostream& err;
};
