#include "script/command.hpp"
#include <string>

/**
 * Convert command type to string for diagnostics and tree dumps
 */
std::string command_type_to_string(CommandType type) {
  switch (type) {
  case CommandType::ASSIGN:
    return "ASSIGN";
  case CommandType::SAY:
    return "SAY";
  case CommandType::WAIT:
    return "WAIT";
  case CommandType::PROMPT:
    return "PROMPT";
  case CommandType::COMMENT:
    return "COMMENT";
  case CommandType::BLANK:
    return "BLANK";
  case CommandType::UNKNOWN:
    return "UNKNOWN";
  case CommandType::START:
    return "START";
  case CommandType::END:
    return "END";
  case CommandType::IF:
    return "IF";
  case CommandType::ELSE:
    return "ELSE";
  case CommandType::END_IF:
    return "END_IF";
  case CommandType::LOOP:
    return "LOOP";
  case CommandType::END_LOOP:
    return "END_LOOP";
  default:
    return "UNKNOWN";
  }
}

std::string loop_count_to_string(const LoopCount &count) {
  if (count.forever)
    return "forever";
  return std::to_string(count.times);
}
