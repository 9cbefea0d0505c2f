#pragma once
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

enum class Severity { DEBUG, INFO, WARNING, ERROR };

struct DiagnosticEntry {
  Severity severity;
  uint32_t line; // 0 when not tied to a source line
  std::string message;
};

std::string severity_to_string(Severity s);

/**
 * Sink for verbose/debug messages produced while parsing and executing.
 *
 * Every report is recorded. It is only echoed to the attached stream (as
 * "[Indy Engine] ...") when verbose is on, so non-fatal problems stay silent
 * by default but can still be inspected or written out with write_log().
 */
class Diagnostics {
public:
  explicit Diagnostics(bool verbose = false, std::ostream *echo = nullptr);

  void report(Severity severity, uint32_t line, const std::string &message);
  void debug(const std::string &message, uint32_t line = 0);
  void info(const std::string &message, uint32_t line = 0);
  void warn(const std::string &message, uint32_t line = 0);
  void error(const std::string &message, uint32_t line = 0);

  bool verbose() const noexcept { return m_verbose; }
  void set_verbose(bool verbose) noexcept { m_verbose = verbose; }

  std::vector<DiagnosticEntry> entries(); // thread-safe snapshot
  size_t count(Severity severity);
  void clear();

  // Writes every recorded entry to `path`; returns false if it can't be opened.
  bool write_log(const std::string &path);

private:
  bool m_verbose;
  std::ostream *m_echo;
  std::vector<DiagnosticEntry> m_entries;
  std::mutex m_mutex;
};
