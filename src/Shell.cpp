#include "Shell.hpp"

int Shell::start_cmdline() {
  print_db_details();

  for (;;) {
    print_prompt();
    input_buffer.read_input();

    if (runner.run_command(input_buffer, command) == ExecuteResponse::Terminate)
      return EXIT_SUCCESS;
  }
}

/********************************************************************************/

int Shell::run() {
  try {
    return start_cmdline();
  } catch (const InputError& e) {
    err << e.what() << "\n";
    return EXIT_FAILURE;
  }
}

/********************************************************************************/

void Shell::print_db_details() {
  out << details.name << " version " << details.version << " "
      << current_timestamp() << "\n";
  out << "Enter \".help\" for usage hints.\n";
  out << "Connected to a transient in-memory database.\n";
  out << "Use \".open FILENAME\" to reopen on a persistent database.\n";
  out << "Enter \".exit\" to exit the database.\n";
}

/********************************************************************************/

void Shell::print_prompt() {
  out << details.name << " > " << std::flush;
}
