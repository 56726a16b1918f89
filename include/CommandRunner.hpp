#pragma once

#include <iostream>

#include "Executor.hpp"
#include "InputBuffer.hpp"
#include "Parser.hpp"
#include "Util.hpp"

/* Glues the Parser and the Executor together. Classification and execution
   failures are printed to the error stream and never leave run_command, the
   only outcome the caller has to act on is ExecuteResponse::Terminate. */
struct CommandRunner {
  CommandRunner()
    : executor{std::cout}, err{std::cerr}
  {};

  CommandRunner(std::ostream& output,
                std::ostream& error)
    : executor{output}, err{error}
  {};

  ExecuteResponse run_command(const InputBuffer& input_buffer,
                              Command&           command);

private:
  void report_parse_error(const CommandResponse& response);

  Parser        parser;
  Executor      executor;
  std::ostream& err;
};
