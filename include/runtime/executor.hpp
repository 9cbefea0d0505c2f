#pragma once
#include "diagnostics.hpp"
#include "runtime/environment.hpp"
#include "script/block.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

using Seconds = std::chrono::duration<double>;

// Blocking sleep primitive; injected so tests don't actually wait.
using SleepFn = std::function<void(Seconds)>;

// std::this_thread::sleep_for, rounded to microseconds and capped at
// microseconds::max().
SleepFn thread_sleep();

struct ExecutorOptions {
  std::string prompt_separator = ": ";
  bool trim_prompt_input = false;
};

/**
 * Runtime counters for one execution.
 */
struct ExecutionMetrics {
  uint32_t executed_commands{0}; // leaf commands with an effect (assign/say/wait/prompt)
  uint32_t branches_taken{0};    // if/else bodies entered
  uint32_t loops_skipped{0};
  uint32_t unknown_lines{0};
  double total_wait_seconds{0.0};
};

/**
 * Walks a parsed Script and performs each node's effect.
 *
 * Single-threaded and strictly sequential: `wait` and `prompt` block the
 * calling thread. The executor borrows the tree read-only and is the only
 * writer of the Environment.
 *
 * Nested bodies are walked with an explicit frame stack, so deep `if`
 * nesting does not grow the call stack.
 *
 * Loop blocks are recognised but their body is never run; execution carries
 * on with the next sibling.
 */
class Executor {
public:
  Executor(Environment &env, std::istream &in, std::ostream &out, Diagnostics &diag,
           SleepFn sleep, ExecutorOptions opts = {});

  void run(const Script &script);
  void execute(const std::vector<Node> &nodes);

  // Evaluates an `if` condition against the current environment.
  bool evaluate(const Condition &cond) const;

  const ExecutionMetrics &metrics() const noexcept { return m_metrics; }

private:
  void execute_command(const Command &cmd);
  // Evaluates the `if` and returns the body to run, or nullptr for none.
  const std::vector<Node> *select_branch(const Node &node);
  void skip_loop(const Node &node);

  void do_assign(const Command &cmd);
  void do_say(const Command &cmd);
  void do_wait(const Command &cmd);
  void do_prompt(const Command &cmd);

  std::string left_value(const Operand &op) const;
  std::string right_value(const Operand &op) const;

  Environment &m_env;
  std::istream &m_in;
  std::ostream &m_out;
  Diagnostics &m_diag;
  SleepFn m_sleep;
  ExecutorOptions m_opts;
  ExecutionMetrics m_metrics;
};
