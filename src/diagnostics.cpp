#include "diagnostics.hpp"
#include <ctime>
#include <fstream>
#include <sstream>

std::string severity_to_string(Severity s) {
  switch (s) {
  case Severity::DEBUG:
    return "DEBUG";
  case Severity::INFO:
    return "INFO";
  case Severity::WARNING:
    return "WARNING";
  case Severity::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

static std::string now_string() {
  std::time_t t = std::time(nullptr);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

Diagnostics::Diagnostics(bool verbose, std::ostream *echo)
    : m_verbose(verbose), m_echo(echo) {}

void Diagnostics::report(Severity severity, uint32_t line, const std::string &message) {
  std::lock_guard<std::mutex> lk(m_mutex);
  m_entries.push_back({severity, line, message});

  if (!m_verbose || m_echo == nullptr)
    return;

  std::ostringstream oss;
  oss << "[Indy Engine] ";
  if (line > 0)
    oss << "line " << line << ": ";
  oss << message << "\n";
  *m_echo << oss.str() << std::flush;
}

void Diagnostics::debug(const std::string &message, uint32_t line) {
  report(Severity::DEBUG, line, message);
}
void Diagnostics::info(const std::string &message, uint32_t line) {
  report(Severity::INFO, line, message);
}
void Diagnostics::warn(const std::string &message, uint32_t line) {
  report(Severity::WARNING, line, message);
}
void Diagnostics::error(const std::string &message, uint32_t line) {
  report(Severity::ERROR, line, message);
}

std::vector<DiagnosticEntry> Diagnostics::entries() {
  std::lock_guard<std::mutex> lk(m_mutex);
  return m_entries;
}

size_t Diagnostics::count(Severity severity) {
  std::lock_guard<std::mutex> lk(m_mutex);
  size_t n = 0;
  for (const auto &e : m_entries)
    if (e.severity == severity)
      ++n;
  return n;
}

void Diagnostics::clear() {
  std::lock_guard<std::mutex> lk(m_mutex);
  m_entries.clear();
}

bool Diagnostics::write_log(const std::string &path) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out)
    return false;

  auto snapshot = entries();
  out << "Indy diagnostics (" << now_string() << "), " << snapshot.size()
      << " entries\n";
  for (const auto &e : snapshot) {
    out << "[" << severity_to_string(e.severity) << "]";
    if (e.line > 0)
      out << " line " << e.line << ":";
    out << " " << e.message << "\n";
  }
  return static_cast<bool>(out);
}
