#include "interpreter.hpp"
#include "script/parse_error.hpp"
#include "script/parser.hpp"
#include <utility>

Interpreter::Interpreter(const Config &cfg, std::istream &in, std::ostream &out,
                         Diagnostics &diag, SleepFn sleep)
    : m_cfg(cfg), m_in(in), m_out(out), m_diag(diag), m_sleep(std::move(sleep)) {
  m_diag.set_verbose(m_cfg.verbose);
}

RunResult Interpreter::run(const std::string &source) {
  RunResult result;

  Script script;
  try {
    script = parse_script(source, &m_diag);
  } catch (const ParseError &e) {
    m_diag.error(e.message(), e.line());
    result.status = RunStatus::PARSE_FAILED;
    result.error_line = e.line();
    result.error = e.message();
    return result;
  }

  ExecutorOptions opts;
  opts.prompt_separator = m_cfg.prompt_separator;
  opts.trim_prompt_input = m_cfg.trim_prompt_input;

  Executor exec(m_env, m_in, m_out, m_diag, m_sleep, opts);
  exec.run(script);

  result.metrics = exec.metrics();
  return result;
}

RunResult run_script(const std::string &source, bool verbose, std::istream &in,
                     std::ostream &out, Diagnostics &diag, SleepFn sleep) {
  Config cfg;
  cfg.verbose = verbose;
  Interpreter interp(cfg, in, out, diag, std::move(sleep));
  return interp.run(source);
}
