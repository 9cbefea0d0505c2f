#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

std::string trim(const std::string &s) {
  auto notspace = [](unsigned char ch) { return !std::isspace(ch); };
  auto first = std::find_if(s.begin(), s.end(), notspace);
  auto last = std::find_if(s.rbegin(), s.rend(), notspace).base();
  if (first >= last)
    return "";
  return std::string(first, last);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    lines.push_back(line);
  }
  if (!lines.empty() && lines.front().rfind("\xEF\xBB\xBF", 0) == 0)
    lines.front().erase(0, 3);
  return lines;
}

bool is_identifier(const std::string &s) {
  if (s.empty())
    return false;
  if (!std::isalpha((unsigned char)s[0]) && s[0] != '_')
    return false;
  for (size_t i = 1; i < s.size(); ++i)
    if (!std::isalnum((unsigned char)s[i]) && s[i] != '_')
      return false;
  return true;
}

bool is_quoted(const std::string &s) {
  return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

std::string strip_quotes(const std::string &s) {
  std::string value = trim(s);
  if (is_quoted(value))
    return value.substr(1, value.size() - 2);
  return value;
}
