#pragma once
#include "config.hpp"
#include "diagnostics.hpp"
#include "runtime/environment.hpp"
#include "runtime/executor.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

enum class RunStatus { COMPLETED, PARSE_FAILED };

struct RunResult {
  RunStatus status{RunStatus::COMPLETED};
  uint32_t error_line{0};
  std::string error; // empty unless PARSE_FAILED
  ExecutionMetrics metrics;

  bool ok() const noexcept { return status == RunStatus::COMPLETED; }
};

/**
 * Parses and executes Indy scripts against one set of I/O handles.
 *
 * The whole script is parsed before anything runs, so a structural error
 * never leaves partial output behind. The environment persists across
 * run() calls on the same instance. cfg.verbose is applied to `diag`.
 */
class Interpreter {
public:
  Interpreter(const Config &cfg, std::istream &in, std::ostream &out, Diagnostics &diag,
              SleepFn sleep = thread_sleep());

  RunResult run(const std::string &source);

  Environment &environment() noexcept { return m_env; }

private:
  Config m_cfg;
  std::istream &m_in;
  std::ostream &m_out;
  Diagnostics &m_diag;
  SleepFn m_sleep;
  Environment m_env;
};

// One-shot helper with default settings and a fresh environment.
RunResult run_script(const std::string &source, bool verbose, std::istream &in,
                     std::ostream &out, Diagnostics &diag, SleepFn sleep = thread_sleep());
