#pragma once
#include "diagnostics.hpp"
#include "script/block.hpp"
#include "script/command.hpp"
#include <string>
#include <vector>

/**
 * Builds the block tree from classified lines.
 *
 * Open `if` / `loop` blocks are kept on an explicit stack rather than the
 * call stack, so parsing does not recurse per nesting level. Lines before
 * `start` and after the closing `end` are skipped, malformed ones included;
 * when a Diagnostics sink is given they are reported as warnings.
 *
 * Throws ParseError on:
 *  - a `wait`, `loop` or `if` inside the script block with a bad argument
 *  - a block left open at end of input (reported at its opening line)
 *  - a terminator that does not match the innermost open block
 *  - a second `else` for the same `if`, or `else` outside an `if`
 *  - a nested `start`, or no `start` at all
 */
class BlockParser {
public:
  explicit BlockParser(Diagnostics *diag = nullptr);

  Script parse(const std::vector<Command> &commands);

private:
  void note_ignored(const Command &cmd, bool after_end);

  Diagnostics *m_diag;
};

// split_lines + tokenize + BlockParser::parse
Script parse_script(const std::string &source, Diagnostics *diag = nullptr);
