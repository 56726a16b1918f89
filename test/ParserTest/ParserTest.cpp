#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "Parser.hpp"
#include "Util.hpp"

Parser test_parser;

bool is_meta(const CommandResponse& resp, MetaCommand meta_command) {
  return resp.status == ParseResponse::Success &&
         resp.command &&
         std::get_if<MetaCommand>(&*resp.command) &&
         std::get<MetaCommand>(*resp.command) == meta_command;
}

bool is_query(const CommandResponse& resp, Query query) {
  return resp.status == ParseResponse::Success &&
         resp.command &&
         std::get_if<Query>(&*resp.command) &&
         std::get<Query>(*resp.command) == query;
}

/********************************************************************************/

bool test_empty_buffer() {
  auto resp = test_parser.parse_command(std::nullopt);

  assert(resp.status == ParseResponse::EmptyBuffer);
  assert(!resp.command);
  return true;
}

/********************************************************************************/

bool test_invalid_buffer() {
  auto resp = test_parser.parse_command(std::string{});

  assert(resp.status == ParseResponse::InvalidBuffer);
  assert(!resp.command);
  return true;
}

/********************************************************************************/

bool test_recognized_meta_commands() {
  for (const auto& [literal, meta_command] : meta_command_map)
    assert(is_meta(test_parser.parse_command(literal), meta_command));

  assert(is_meta(test_parser.parse_command(".exit"), MetaCommand::Exit));
  assert(is_meta(test_parser.parse_command(".help"), MetaCommand::Help));
  return true;
}

/********************************************************************************/

bool test_unrecognized_meta_commands() {
  const std::vector<std::string> lines = {
    ".frobnicate", ".", ".exit ", ".EXIT", ".helpme", "..exit", ".open db.file"
  };

  for (const auto& line : lines) {
    auto resp = test_parser.parse_command(line);
    assert(resp.status == ParseResponse::UnrecognizedMetaCommand);
    assert(resp.text == line);
    assert(!resp.command);
  }
  return true;
}

/********************************************************************************/

bool test_queries_ignore_trailing_content() {
  assert(is_query(test_parser.parse_command("select"), Query::Select));
  assert(is_query(test_parser.parse_command("select * from t"), Query::Select));
  assert(is_query(test_parser.parse_command("selection"), Query::Select));
  assert(is_query(test_parser.parse_command("insert"), Query::Insert));
  assert(is_query(test_parser.parse_command("insert 1 user1 person1@example.com"), Query::Insert));
  return true;
}

/********************************************************************************/

bool test_unrecognized_queries() {
  const std::vector<std::string> lines = {
    "SELECT * from t", "update t", " select", "sel", "delete", "exit"
  };

  for (const auto& line : lines) {
    auto resp = test_parser.parse_command(line);
    assert(resp.status == ParseResponse::UnrecognizedQuery);
    assert(resp.text == line);
  }
  return true;
}

/********************************************************************************/

bool test_classification_is_idempotent() {
  const std::vector<std::string> lines = {
    ".help", ".exit", ".nope", "select 1", "insert 2", "drop", ""
  };

  for (const auto& line : lines) {
    auto first  = test_parser.parse_command(line);
    auto second = test_parser.parse_command(line);

    assert(first.status  == second.status);
    assert(first.command == second.command);
    assert(first.text    == second.text);
  }
  return true;
}

/********************************************************************************/

int main() {
  std::cout << "\nParser Tests:\n";

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_empty_buffer()\n";
  assert(test_empty_buffer());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_invalid_buffer()\n";
  assert(test_invalid_buffer());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_recognized_meta_commands()\n";
  assert(test_recognized_meta_commands());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_unrecognized_meta_commands()\n";
  assert(test_unrecognized_meta_commands());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_queries_ignore_trailing_content()\n";
  assert(test_queries_ignore_trailing_content());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_unrecognized_queries()\n";
  assert(test_unrecognized_queries());

  std::cout << "*******************************************\n";
  std::cout << "TEST: test_classification_is_idempotent()\n";
  assert(test_classification_is_idempotent());

  std::cout << "\nAll Tests Passed!\n";
}
