#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Raised by the lexer and block parser. Any ParseError aborts the run before
 * a single node executes.
 *
 * `expected` / `found` are filled for terminator problems (e.g. expected
 * "end if", found "end loop") and left empty otherwise.
 */
class ParseError : public std::runtime_error {
public:
  ParseError(uint32_t line, const std::string &message,
             std::string expected = "", std::string found = "");

  uint32_t line() const noexcept { return m_line; }
  const std::string &message() const noexcept { return m_message; }
  const std::string &expected() const noexcept { return m_expected; }
  const std::string &found() const noexcept { return m_found; }

private:
  uint32_t m_line;
  std::string m_message;
  std::string m_expected;
  std::string m_found;
};
