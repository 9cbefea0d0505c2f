#include "script/lexer.hpp"
#include "script/parse_error.hpp"
#include "util.hpp"
#include <cctype>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>

static Command make_unknown(Command cmd, const std::string &reason = "") {
  cmd.type = CommandType::UNKNOWN;
  cmd.args = {reason};
  return cmd;
}

// Longest wait whose microsecond count still fits std::chrono::microseconds.
static const double MAX_WAIT_SECONDS =
    static_cast<double>(std::chrono::microseconds::max().count()) / 1e6;

/**
 * Parses the argument of `wait`: one non-negative, finite decimal number.
 * Fractions are allowed ("0.25", ".5"). Values too large for the sleep
 * clock are rejected.
 */
static double parse_seconds(const std::string &arg, uint32_t line_no) {
  const std::string usage = "invalid duration for 'wait': '" + arg +
                            "' (expected a number of seconds)";
  if (arg.empty())
    throw ParseError(line_no, "'wait' requires a duration in seconds");

  for (unsigned char c : arg)
    if (!std::isdigit(c) && c != '.')
      throw ParseError(line_no, usage);

  double seconds = 0.0;
  size_t used = 0;
  try {
    seconds = std::stod(arg, &used);
  } catch (const std::invalid_argument &) {
    throw ParseError(line_no, usage);
  } catch (const std::out_of_range &) {
    throw ParseError(line_no, usage);
  }
  if (used != arg.size() || !std::isfinite(seconds))
    throw ParseError(line_no, usage);
  if (seconds >= MAX_WAIT_SECONDS)
    throw ParseError(line_no, "duration for 'wait' is too large: '" + arg + "'");
  return seconds;
}

/**
 * Parses the argument of `loop`: a non-negative integer or `forever`.
 */
static LoopCount parse_loop_count(const std::string &arg, uint32_t line_no) {
  const std::string usage = "invalid count for 'loop': '" + arg +
                            "' (expected a non-negative integer or 'forever')";
  LoopCount count;
  if (arg == "forever") {
    count.forever = true;
    return count;
  }
  if (arg.empty())
    throw ParseError(line_no, "'loop' requires a count or 'forever'");

  for (unsigned char c : arg)
    if (!std::isdigit(c))
      throw ParseError(line_no, usage);

  try {
    count.times = std::stoull(arg);
  } catch (const std::out_of_range &) {
    throw ParseError(line_no, usage);
  }
  return count;
}

static Operand make_operand(const std::string &text) {
  Operand op;
  op.quoted = is_quoted(text);
  op.text = op.quoted ? text.substr(1, text.size() - 2) : text;
  op.bare_identifier = !op.quoted && is_identifier(op.text);
  return op;
}

// `<left> == <right>` or `<left> != <right>`; `==` is searched first.
static Condition parse_condition(const std::string &text, uint32_t line_no) {
  Condition cond;
  size_t pos = text.find("==");
  cond.op = CompareOp::EQ;
  if (pos == std::string::npos) {
    pos = text.find("!=");
    cond.op = CompareOp::NE;
  }
  if (pos == std::string::npos)
    throw ParseError(line_no, "invalid condition '" + text +
                                  "'. Use VAR == VALUE or VAR != VALUE");

  std::string left = trim(text.substr(0, pos));
  std::string right = trim(text.substr(pos + 2));
  if (left.empty())
    throw ParseError(line_no, "condition '" + text + "' has no left-hand side");

  cond.left = make_operand(left);
  cond.right = make_operand(right);
  return cond;
}

Command classify_line(const std::string &text, uint32_t line_no) {
  Command cmd;
  cmd.line = line_no;
  cmd.raw = text;

  const std::string trimmed = trim(text);

  if (!trimmed.empty() && trimmed[0] == '#') {
    cmd.type = CommandType::COMMENT;
    return cmd;
  }
  if (trimmed.empty()) {
    cmd.type = CommandType::BLANK;
    return cmd;
  }

  // Name="value" / Name=value, but not `X == y`
  size_t eq = trimmed.find('=');
  if (eq != std::string::npos) {
    std::string name = trim(trimmed.substr(0, eq));
    bool doubled = eq + 1 < trimmed.size() && trimmed[eq + 1] == '=';
    if (is_identifier(name) && !doubled) {
      cmd.type = CommandType::ASSIGN;
      cmd.args = {name, strip_quotes(trimmed.substr(eq + 1))};
      return cmd;
    }
  }

  const std::vector<std::string> words = split(trimmed);
  const std::string &head = words[0];
  const std::string rest = trim(trimmed.substr(head.size()));

  DEBUG_PRINT(DEBUG_LEXER, "line %u head='%s' rest='%s'", line_no, head.c_str(), rest.c_str());

  if (head == "start") {
    if (words.size() != 1)
      return make_unknown(cmd, "unexpected text after 'start'");
    cmd.type = CommandType::START;
  } else if (head == "end") {
    if (words.size() == 1)
      cmd.type = CommandType::END;
    else if (words.size() == 2 && words[1] == "if")
      cmd.type = CommandType::END_IF;
    else if (words.size() == 2 && words[1] == "loop")
      cmd.type = CommandType::END_LOOP;
    else
      return make_unknown(cmd, "expected 'end', 'end if' or 'end loop'");
  } else if (head == "else") {
    if (words.size() != 1)
      return make_unknown(cmd, "unexpected text after 'else'");
    cmd.type = CommandType::ELSE;
  } else if (head == "say") {
    cmd.type = CommandType::SAY;
    cmd.args = {strip_quotes(rest)};
  } else if (head == "wait") {
    cmd.type = CommandType::WAIT;
    try {
      cmd.seconds = parse_seconds(rest, line_no);
    } catch (const ParseError &e) {
      cmd.error = e.message();
    }
  } else if (head == "prompt") {
    size_t sep = rest.find('=');
    std::string name = sep == std::string::npos ? "" : trim(rest.substr(0, sep));
    if (!is_identifier(name))
      return make_unknown(cmd, "'prompt' syntax is incorrect. Use: prompt VAR=\"Message\"");
    cmd.type = CommandType::PROMPT;
    cmd.args = {name, strip_quotes(rest.substr(sep + 1))};
  } else if (head == "if") {
    cmd.type = CommandType::IF;
    try {
      cmd.condition = parse_condition(rest, line_no);
    } catch (const ParseError &e) {
      cmd.error = e.message();
    }
  } else if (head == "loop") {
    cmd.type = CommandType::LOOP;
    try {
      cmd.count = parse_loop_count(rest, line_no);
    } catch (const ParseError &e) {
      cmd.error = e.message();
    }
  } else {
    return make_unknown(cmd);
  }

  return cmd;
}

std::vector<Command> tokenize(const std::vector<std::string> &lines) {
  std::vector<Command> out;
  out.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i)
    out.push_back(classify_line(lines[i], static_cast<uint32_t>(i + 1)));
  return out;
}
