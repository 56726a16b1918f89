#include "CommandRunner.hpp"

ExecuteResponse CommandRunner::run_command(const InputBuffer& input_buffer,
                                           Command&           command)
{
  const CommandResponse response = parser.parse_command(input_buffer.buffer);

  if (response.status != ParseResponse::Success) {
    command.variant.reset();
    report_parse_error(response);
    return ExecuteResponse::ParseFailure;
  }

  command.variant = response.command;

  const ExecuteResponse exec_response = executor.execute_command(command);
  if (exec_response == ExecuteResponse::UnrecognizedCommand)
    err << "Error executing command: Unrecognized command\n";

  return exec_response;
}

/********************************************************************************/

void CommandRunner::report_parse_error(const CommandResponse& response) {
  switch (response.status) {
    case ParseResponse::EmptyBuffer:
      err << "Input buffer is empty.\n";
    break;
    /*************************/
    case ParseResponse::InvalidBuffer:
      err << "Invalid input buffer.\n";
    break;
    /*************************/
    case ParseResponse::UnrecognizedMetaCommand:
      err << "Unrecognized command: '" << response.text << "'.\n";
    break;
    /*************************/
    case ParseResponse::UnrecognizedQuery:
      err << "Unrecognized query: '" << response.text << "'.\n";
    break;
    /*************************/
    default: break;
  }
}
