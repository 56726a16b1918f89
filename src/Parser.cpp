#include "Parser.hpp"

CommandResponse Parser::parse_command(const std::optional<std::string>& buffer) const {
  if (!buffer)
    return {std::nullopt, ParseResponse::EmptyBuffer, ""};

  const std::string_view sv = *buffer;

  if (sv.empty())
    return {std::nullopt, ParseResponse::InvalidBuffer, ""};

  if (sv.front() == META_SENTINEL)
    return parse_meta_command(sv);

  return parse_query(sv);
}

/********************************************************************************/

CommandResponse Parser::parse_meta_command(std::string_view sv) const {
  const auto srch = std::string(sv);

  if (!meta_command_map.count(srch))
    return {std::nullopt, ParseResponse::UnrecognizedMetaCommand, srch};

  return {meta_command_map.at(srch), ParseResponse::Success, ""};
}

/********************************************************************************/

CommandResponse Parser::parse_query(std::string_view sv) const {
  for (const auto& [keyword, query] : query_map)
    if (sv.starts_with(keyword))
      return {query, ParseResponse::Success, ""};

  return {std::nullopt, ParseResponse::UnrecognizedQuery, std::string(sv)};
}
