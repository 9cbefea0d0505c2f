#include "script/parse_error.hpp"
#include <string>
#include <utility>

ParseError::ParseError(uint32_t line, const std::string &message,
                       std::string expected, std::string found)
    : std::runtime_error("line " + std::to_string(line) + ": " + message),
      m_line(line), m_message(message), m_expected(std::move(expected)),
      m_found(std::move(found)) {}
