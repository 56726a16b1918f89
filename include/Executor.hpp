#pragma once

#include <iostream>
#include <string>

#include "Util.hpp"

enum class ExecuteResponse {
  ParseFailure, /* the line never reached the Executor, only CommandRunner reports this */
  UnrecognizedCommand,
  Terminate, /* the shell should stop reading input and exit successfully */
  Success
};

const std::string HELP_TEXT =
  "Meta commands:\n"
  "  .help            show this message\n"
  "  .exit            exit the database\n"
  "Queries:\n"
  "  insert ...       insert a row\n"
  "  select ...       read rows\n";

/********************************************************************************/

struct Executor {
  Executor()
    : out{std::cout}
  {};

  Executor(std::ostream& output)
    : out{output}
  {};

  ExecuteResponse execute_command(const Command& command);

private:
  ExecuteResponse execute_meta_command(const MetaCommand meta_command);
  ExecuteResponse execute_query       (const Query       query);

  std::ostream& out;
};
