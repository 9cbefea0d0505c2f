#include "runtime/environment.hpp"
#include <algorithm>
#include <utility>

std::string Environment::get(const std::string &name) const {
  auto it = m_vars.find(name);
  if (it == m_vars.end())
    return "";
  return it->second;
}

void Environment::set(const std::string &name, std::string value) {
  m_vars[name] = std::move(value);
}

bool Environment::contains(const std::string &name) const {
  return m_vars.find(name) != m_vars.end();
}

std::vector<std::string> Environment::names() const {
  std::vector<std::string> out;
  out.reserve(m_vars.size());
  for (const auto &[name, value] : m_vars)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

std::string interpolate(const std::string &tmpl, const Environment &env) {
  std::string out;
  out.reserve(tmpl.size());

  size_t i = 0;
  while (i < tmpl.size()) {
    size_t open = tmpl.find('{', i);
    if (open == std::string::npos) {
      out.append(tmpl, i, std::string::npos);
      break;
    }
    size_t close = tmpl.find('}', open + 1);
    if (close == std::string::npos) {
      // unmatched '{': keep the remainder verbatim
      out.append(tmpl, i, std::string::npos);
      break;
    }
    // a placeholder never contains '{': start from the last one before '}'
    open = tmpl.rfind('{', close);
    out.append(tmpl, i, open - i);
    out += env.get(tmpl.substr(open + 1, close - open - 1));
    i = close + 1;
  }
  return out;
}
