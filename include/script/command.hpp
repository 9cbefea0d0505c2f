#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class CommandType {
  // Leaf commands
  ASSIGN,
  SAY,
  WAIT,
  PROMPT,
  COMMENT,
  BLANK,
  UNKNOWN,
  // Block delimiters, consumed by the parser
  START,
  END,
  IF,
  ELSE,
  END_IF,
  LOOP,
  END_LOOP,
};

enum class CompareOp { EQ, NE };

/**
 * One side of an `if` comparison.
 * A bare identifier on the left reads that variable. On the right it reads
 * the variable only if it is defined, and otherwise is compared as written.
 */
struct Operand {
  std::string text;    // quotes already removed
  bool quoted{false};
  bool bare_identifier{false};
};

struct Condition {
  Operand left;
  CompareOp op{CompareOp::EQ};
  Operand right;
};

// Declared iteration count of a `loop`; `forever` has no count.
struct LoopCount {
  bool forever{false};
  uint64_t times{0};
};

// Represents a single classified source line
struct Command {
  CommandType type{CommandType::BLANK};
  uint32_t line{0};                 // 1-based source line
  std::string raw;                  // untouched source text
  // ASSIGN: {name, literal}   SAY: {template}   PROMPT: {name, message}
  // UNKNOWN: {reason} (may be empty)
  std::vector<std::string> args;
  double seconds{0.0};              // WAIT
  Condition condition;              // IF
  LoopCount count;                  // LOOP
  // WAIT / IF / LOOP whose argument could not be parsed; empty when valid
  std::string error;
};

std::string command_type_to_string(CommandType type);
std::string loop_count_to_string(const LoopCount &count);
