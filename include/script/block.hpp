#pragma once
#include "script/command.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class NodeKind { COMMAND, IF_ELSE, LOOP };

/**
 * A node of the executable tree: either a leaf command or a nested block.
 *
 * - COMMAND: `command` holds the leaf (ASSIGN, SAY, WAIT, PROMPT, COMMENT,
 *   BLANK, UNKNOWN).
 * - IF_ELSE: `command` is the opening `if` line (its condition is used);
 *   `body` is the then-branch and `else_body` the optional else-branch.
 * - LOOP: `command` is the opening `loop` line (its count is used); `body`
 *   is parsed and kept but not run by the executor.
 */
struct Node {
  NodeKind kind{NodeKind::COMMAND};
  Command command;
  std::vector<Node> body;
  std::vector<Node> else_body;
  bool has_else{false};
  uint32_t end_line{0}; // line of the matching terminator, blocks only
};

// The single `start ... end` region.
struct Script {
  std::vector<Node> body;
  uint32_t start_line{0};
  uint32_t end_line{0};
};

bool operator==(const Node &a, const Node &b);
bool operator==(const Script &a, const Script &b);

// Indented multi-line dump of the tree, used for debugging and tests.
std::string dump_tree(const Script &script);
