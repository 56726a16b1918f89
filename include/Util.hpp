#pragma once

#include <optional>
#include <string>
#include <variant>

enum class MetaCommand {
  Exit,
  Help
};

enum class Query {
  Insert,
  Select
};

using CommandType = std::variant<MetaCommand, Query>;

/* the single command slot the shell reuses between lines, an empty variant
   means nothing has been classified yet or the last line failed to classify */
struct Command {
  std::optional<CommandType> variant;

  bool empty() const
  { return !variant.has_value(); }
};

/********************************************************************************/
/* Shell constants */
constexpr char META_SENTINEL = '.'; /* first character of every meta command */

/********************************************************************************/

/* name and version of the program, filled in once at startup */
struct DbDetails {
  std::string name;
  std::string version;
};

std::string current_timestamp();
