#include "Executor.hpp"

ExecuteResponse Executor::execute_command(const Command& command) {
  if (command.empty())
    return ExecuteResponse::UnrecognizedCommand;

  const CommandType& cmd = *command.variant;

  if (const auto* meta_command = std::get_if<MetaCommand>(&cmd))
    return execute_meta_command(*meta_command);

  return execute_query(std::get<Query>(cmd));
}

/********************************************************************************/

ExecuteResponse Executor::execute_meta_command(const MetaCommand meta_command) {
  switch (meta_command) {
    case MetaCommand::Exit:
      return ExecuteResponse::Terminate;
    /*************************/
    case MetaCommand::Help:
      out << HELP_TEXT;
      return ExecuteResponse::Success;
  }

  return ExecuteResponse::UnrecognizedCommand;
}

/********************************************************************************/

/* no storage behind these yet, they only report what would run */
ExecuteResponse Executor::execute_query(const Query query) {
  switch (query) {
    case Query::Insert:
      out << "This is where we would do an insert.\n";
      return ExecuteResponse::Success;
    /*************************/
    case Query::Select:
      out << "This is where we would do a select.\n";
      return ExecuteResponse::Success;
  }

  return ExecuteResponse::UnrecognizedCommand;
}
