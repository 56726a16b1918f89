#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "Util.hpp"

/* meta commands are matched against the whole line */
const std::unordered_map<std::string, MetaCommand> meta_command_map {
  {".exit", MetaCommand::Exit}, {".help", MetaCommand::Help}
};

/* queries are matched on their leading keyword only, the keywords must stay
   prefix disjoint since the first hit wins */
const std::unordered_map<std::string, Query> query_map {
  {"insert", Query::Insert}, {"select", Query::Select}
};

/********************************************************************************/

enum class ParseResponse {
  EmptyBuffer,
  InvalidBuffer,
  UnrecognizedMetaCommand,
  UnrecognizedQuery,
  Success
};

struct CommandResponse {
  std::optional<CommandType> command;
  ParseResponse              status;
  std::string                text; /* offending line, set on the unrecognized responses */
};

/********************************************************************************/

struct Parser {
  CommandResponse parse_command(const std::optional<std::string>& buffer) const;

private:
  CommandResponse parse_meta_command(std::string_view sv) const;
  CommandResponse parse_query       (std::string_view sv) const;
};
