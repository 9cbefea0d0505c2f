#include "runtime/executor.hpp"
#include "util.hpp"
#include <sstream>
#include <string>
#include <thread>
#include <utility>

SleepFn thread_sleep() {
  return [](Seconds d) {
    using std::chrono::microseconds;
    if (d.count() <= 0.0)
      return;
    // duration_cast past microseconds::max() is undefined; cap instead
    if (d >= Seconds(static_cast<double>(microseconds::max().count()) / 1e6)) {
      std::this_thread::sleep_for(microseconds::max());
      return;
    }
    std::this_thread::sleep_for(std::chrono::duration_cast<microseconds>(d));
  };
}

static std::string format_seconds(double s) {
  std::ostringstream oss;
  oss << s;
  return oss.str();
}

Executor::Executor(Environment &env, std::istream &in, std::ostream &out, Diagnostics &diag,
                   SleepFn sleep, ExecutorOptions opts)
    : m_env(env), m_in(in), m_out(out), m_diag(diag), m_sleep(std::move(sleep)),
      m_opts(std::move(opts)) {
  if (!m_sleep)
    m_sleep = thread_sleep();
}

void Executor::run(const Script &script) {
  m_diag.info("Script started.", script.start_line);
  execute(script.body);
  m_out.flush();
  m_diag.info("Script finished.", script.end_line);
}

void Executor::execute(const std::vector<Node> &nodes) {
  // A taken branch is pushed as a new frame and runs to completion before its
  // parent's next sibling. No recursion, so depth is bounded by the heap.
  struct Frame {
    const std::vector<Node> *body;
    size_t next;
  };
  std::vector<Frame> frames{{&nodes, 0}};

  while (!frames.empty()) {
    Frame &top = frames.back();
    if (top.next >= top.body->size()) {
      frames.pop_back();
      continue;
    }
    const Node &node = (*top.body)[top.next++];

    switch (node.kind) {
    case NodeKind::IF_ELSE:
      if (const std::vector<Node> *branch = select_branch(node))
        frames.push_back({branch, 0});
      break;
    case NodeKind::LOOP:
      skip_loop(node);
      break;
    default:
      execute_command(node.command);
      break;
    }
  }
}

void Executor::execute_command(const Command &cmd) {
  DEBUG_PRINT(DEBUG_EXECUTOR, "line %u %s", cmd.line, command_type_to_string(cmd.type).c_str());

  switch (cmd.type) {
  case CommandType::ASSIGN:
    do_assign(cmd);
    break;
  case CommandType::SAY:
    do_say(cmd);
    break;
  case CommandType::WAIT:
    do_wait(cmd);
    break;
  case CommandType::PROMPT:
    do_prompt(cmd);
    break;
  case CommandType::UNKNOWN: {
    ++m_metrics.unknown_lines;
    std::string msg = "unknown command or bad syntax: '" + trim(cmd.raw) + "'";
    if (!cmd.args.empty() && !cmd.args[0].empty())
      msg += " (" + cmd.args[0] + ")";
    m_diag.warn(msg, cmd.line);
    return;
  }
  default:
    // COMMENT, BLANK
    return;
  }
  ++m_metrics.executed_commands;
}

void Executor::do_assign(const Command &cmd) {
  m_env.set(cmd.args[0], interpolate(cmd.args[1], m_env));
}

void Executor::do_say(const Command &cmd) {
  m_out << interpolate(cmd.args[0], m_env) << "\n";
}

void Executor::do_wait(const Command &cmd) {
  m_diag.info("Waiting for " + format_seconds(cmd.seconds) + " seconds...", cmd.line);
  // anything already said must be visible before the pause
  m_out.flush();
  m_sleep(Seconds(cmd.seconds));
  m_metrics.total_wait_seconds += cmd.seconds;
}

void Executor::do_prompt(const Command &cmd) {
  const std::string &name = cmd.args[0];
  m_out << interpolate(cmd.args[1], m_env) << m_opts.prompt_separator << std::flush;

  std::string input;
  if (!std::getline(m_in, input)) {
    m_diag.warn("no input available for prompt '" + name + "'; storing an empty value", cmd.line);
    m_env.set(name, "");
    return;
  }
  if (!input.empty() && input.back() == '\r')
    input.pop_back();
  if (m_opts.trim_prompt_input)
    input = trim(input);
  m_env.set(name, std::move(input));
}

std::string Executor::left_value(const Operand &op) const {
  if (op.bare_identifier)
    return m_env.get(op.text);
  return interpolate(op.text, m_env);
}

std::string Executor::right_value(const Operand &op) const {
  if (op.bare_identifier && m_env.contains(op.text))
    return m_env.get(op.text);
  return op.text;
}

bool Executor::evaluate(const Condition &cond) const {
  const std::string left = left_value(cond.left);
  const std::string right = right_value(cond.right);
  return cond.op == CompareOp::EQ ? left == right : left != right;
}

const std::vector<Node> *Executor::select_branch(const Node &node) {
  const bool taken = evaluate(node.command.condition);
  m_diag.debug(std::string("condition '") + trim(node.command.raw) + "' is " +
                   (taken ? "true" : "false"),
               node.command.line);

  if (taken) {
    ++m_metrics.branches_taken;
    return &node.body;
  }
  if (node.has_else) {
    ++m_metrics.branches_taken;
    return &node.else_body;
  }
  return nullptr;
}

void Executor::skip_loop(const Node &node) {
  ++m_metrics.loops_skipped;
  m_diag.info("Loop encountered (" + loop_count_to_string(node.command.count) +
                  "). Simulation: skipping block to continue execution",
              node.command.line);
}
