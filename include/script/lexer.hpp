#pragma once
#include "script/command.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * Classifies one raw source line into a Command.
 *
 * Rules, first match wins:
 *  1. first non-blank char is '#'           -> COMMENT
 *  2. empty / whitespace only               -> BLANK
 *  3. Identifier=value                      -> ASSIGN
 *  4. start/end/say/wait/prompt/if/else/end if/loop/end loop -> keyword
 *  5. anything else                         -> UNKNOWN
 *
 * Pure function of its input. A `wait` or `loop` with a malformed number, or
 * an `if` whose condition cannot be split, keeps its keyword type and carries
 * the reason in Command::error. Whether that is fatal depends on where the
 * line sits, which only the parser knows.
 */
Command classify_line(const std::string &text, uint32_t line_no);

// classify_line over every line; line numbers start at 1.
std::vector<Command> tokenize(const std::vector<std::string> &lines);
