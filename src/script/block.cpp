#include "script/block.hpp"
#include <sstream>
#include <string>

static bool same_operand(const Operand &a, const Operand &b) {
  return a.text == b.text && a.quoted == b.quoted && a.bare_identifier == b.bare_identifier;
}

// Structural equality: line numbers and raw text are part of the identity.
static bool same_command(const Command &a, const Command &b) {
  return a.type == b.type && a.line == b.line && a.raw == b.raw && a.args == b.args &&
         a.seconds == b.seconds && a.condition.op == b.condition.op &&
         same_operand(a.condition.left, b.condition.left) &&
         same_operand(a.condition.right, b.condition.right) &&
         a.count.forever == b.count.forever && a.count.times == b.count.times;
}

bool operator==(const Node &a, const Node &b) {
  return a.kind == b.kind && a.has_else == b.has_else && a.end_line == b.end_line &&
         same_command(a.command, b.command) && a.body == b.body &&
         a.else_body == b.else_body;
}

bool operator==(const Script &a, const Script &b) {
  return a.start_line == b.start_line && a.end_line == b.end_line && a.body == b.body;
}

static void dump_nodes(const std::vector<Node> &nodes, int depth, std::ostringstream &oss) {
  const std::string pad(static_cast<size_t>(depth) * 2, ' ');
  for (const auto &n : nodes) {
    const Command &c = n.command;
    switch (n.kind) {
    case NodeKind::IF_ELSE:
      oss << pad << "IF " << (c.condition.left.quoted ? "\"" + c.condition.left.text + "\"" : c.condition.left.text)
          << (c.condition.op == CompareOp::EQ ? " == " : " != ")
          << (c.condition.right.quoted ? "\"" + c.condition.right.text + "\"" : c.condition.right.text)
          << " @" << c.line << "\n";
      dump_nodes(n.body, depth + 1, oss);
      if (n.has_else) {
        oss << pad << "ELSE\n";
        dump_nodes(n.else_body, depth + 1, oss);
      }
      oss << pad << "END_IF @" << n.end_line << "\n";
      break;
    case NodeKind::LOOP:
      oss << pad << "LOOP " << loop_count_to_string(c.count) << " @" << c.line << "\n";
      dump_nodes(n.body, depth + 1, oss);
      oss << pad << "END_LOOP @" << n.end_line << "\n";
      break;
    default:
      oss << pad << command_type_to_string(c.type);
      if (c.type == CommandType::WAIT)
        oss << "(" << c.seconds << ")";
      else if (!c.args.empty()) {
        oss << "(";
        for (size_t i = 0; i < c.args.size(); ++i) {
          if (i)
            oss << ", ";
          oss << c.args[i];
        }
        oss << ")";
      }
      oss << " @" << c.line << "\n";
      break;
    }
  }
}

std::string dump_tree(const Script &script) {
  std::ostringstream oss;
  oss << "SCRIPT @" << script.start_line << "\n";
  dump_nodes(script.body, 1, oss);
  oss << "END @" << script.end_line << "\n";
  return oss.str();
}
