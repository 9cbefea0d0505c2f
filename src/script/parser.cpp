#include "script/parser.hpp"
#include "script/lexer.hpp"
#include "script/parse_error.hpp"
#include "util.hpp"
#include <string>
#include <utility>

namespace {

// A block whose terminator has not been seen yet.
struct OpenBlock {
  Node node;
  bool in_else{false};
};

enum class Phase { BEFORE_START, IN_SCRIPT, AFTER_END };

const char *block_name(NodeKind kind) {
  return kind == NodeKind::LOOP ? "loop" : "if";
}

const char *terminator_for(NodeKind kind) {
  return kind == NodeKind::LOOP ? "end loop" : "end if";
}

const char *terminator_text(CommandType type) {
  switch (type) {
  case CommandType::END_IF:
    return "end if";
  case CommandType::END_LOOP:
    return "end loop";
  case CommandType::ELSE:
    return "else";
  default:
    return "end";
  }
}

} // namespace

BlockParser::BlockParser(Diagnostics *diag) : m_diag(diag) {}

void BlockParser::note_ignored(const Command &cmd, bool after_end) {
  if (!m_diag || cmd.type == CommandType::COMMENT || cmd.type == CommandType::BLANK)
    return;
  std::string msg = std::string("ignoring '") + trim(cmd.raw) + "' " +
                    (after_end ? "after the closing 'end'" : "before 'start'");
  if (!cmd.error.empty())
    msg += " (" + cmd.error + ")";
  m_diag->warn(msg, cmd.line);
}

Script BlockParser::parse(const std::vector<Command> &commands) {
  Script script;
  Phase phase = Phase::BEFORE_START;
  std::vector<OpenBlock> stack;

  // Where the next node goes: the innermost open block's active branch.
  auto active_body = [&]() -> std::vector<Node> & {
    if (stack.empty())
      return script.body;
    OpenBlock &top = stack.back();
    return top.in_else ? top.node.else_body : top.node.body;
  };

  for (const Command &cmd : commands) {
    if (phase == Phase::BEFORE_START) {
      if (cmd.type == CommandType::START) {
        phase = Phase::IN_SCRIPT;
        script.start_line = cmd.line;
      } else {
        note_ignored(cmd, false);
      }
      continue;
    }
    if (phase == Phase::AFTER_END) {
      note_ignored(cmd, true);
      continue;
    }

    DEBUG_PRINT(DEBUG_PARSER, "line %u %s depth=%zu", cmd.line,
                command_type_to_string(cmd.type).c_str(), stack.size());

    if (!cmd.error.empty())
      throw ParseError(cmd.line, cmd.error);

    switch (cmd.type) {
    case CommandType::START:
      throw ParseError(cmd.line, "unexpected 'start': the script block was already opened at line " +
                                     std::to_string(script.start_line),
                       "", "start");

    case CommandType::IF:
    case CommandType::LOOP: {
      OpenBlock block;
      block.node.kind = cmd.type == CommandType::IF ? NodeKind::IF_ELSE : NodeKind::LOOP;
      block.node.command = cmd;
      stack.push_back(std::move(block));
      break;
    }

    case CommandType::ELSE: {
      if (stack.empty() || stack.back().node.kind != NodeKind::IF_ELSE) {
        std::string expected = stack.empty() ? "end" : terminator_for(stack.back().node.kind);
        throw ParseError(cmd.line, "'else' without a matching 'if'", expected, "else");
      }
      OpenBlock &top = stack.back();
      if (top.in_else)
        throw ParseError(cmd.line, "duplicate 'else' for the 'if' opened at line " +
                                       std::to_string(top.node.command.line),
                         "end if", "else");
      top.in_else = true;
      top.node.has_else = true;
      break;
    }

    case CommandType::END_IF:
    case CommandType::END_LOOP: {
      const std::string found = terminator_text(cmd.type);
      if (stack.empty())
        throw ParseError(cmd.line, "'" + found + "' without a matching '" +
                                       (cmd.type == CommandType::END_IF ? "if" : "loop") + "'",
                         "end", found);

      NodeKind wanted = cmd.type == CommandType::END_IF ? NodeKind::IF_ELSE : NodeKind::LOOP;
      const OpenBlock &top = stack.back();
      if (top.node.kind != wanted)
        throw ParseError(cmd.line, "mismatched terminator: expected '" +
                                       std::string(terminator_for(top.node.kind)) + "' for the '" +
                                       block_name(top.node.kind) + "' opened at line " +
                                       std::to_string(top.node.command.line) + ", found '" +
                                       found + "'",
                         terminator_for(top.node.kind), found);

      Node done = std::move(stack.back().node);
      stack.pop_back();
      done.end_line = cmd.line;
      active_body().push_back(std::move(done));
      break;
    }

    case CommandType::END:
      if (!stack.empty()) {
        const OpenBlock &top = stack.back();
        throw ParseError(cmd.line, "mismatched terminator: expected '" +
                                       std::string(terminator_for(top.node.kind)) + "' for the '" +
                                       block_name(top.node.kind) + "' opened at line " +
                                       std::to_string(top.node.command.line) + ", found 'end'",
                         terminator_for(top.node.kind), "end");
      }
      script.end_line = cmd.line;
      phase = Phase::AFTER_END;
      break;

    default: {
      Node leaf;
      leaf.kind = NodeKind::COMMAND;
      leaf.command = cmd;
      active_body().push_back(std::move(leaf));
      break;
    }
    }
  }

  const uint32_t eof_line = commands.empty() ? 0 : commands.back().line;

  if (!stack.empty()) {
    // Report the innermost block: it is the one that needed closing first.
    const OpenBlock &open = stack.back();
    throw ParseError(open.node.command.line,
                     std::string("unterminated '") + block_name(open.node.kind) +
                         "' block opened at line " + std::to_string(open.node.command.line) +
                         " (expected '" + terminator_for(open.node.kind) + "')",
                     terminator_for(open.node.kind), "end of input");
  }
  if (phase == Phase::BEFORE_START)
    throw ParseError(eof_line, "no 'start' found; the script must be wrapped in 'start' ... 'end'",
                     "start", "end of input");
  if (phase == Phase::IN_SCRIPT)
    throw ParseError(script.start_line,
                     "unterminated script block opened at line " +
                         std::to_string(script.start_line) + " (expected 'end')",
                     "end", "end of input");

  return script;
}

Script parse_script(const std::string &source, Diagnostics *diag) {
  BlockParser parser(diag);
  return parser.parse(tokenize(split_lines(source)));
}
