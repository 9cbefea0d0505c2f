#pragma once
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Flat, script-wide variable storage. Every value is a string.
 *
 * Assignment creates or overwrites; there is no declaration step and no
 * deletion. Reading a name that was never set yields "" instead of failing.
 */
class Environment {
public:
  std::string get(const std::string &name) const;
  void set(const std::string &name, std::string value);
  bool contains(const std::string &name) const;

  size_t size() const noexcept { return m_vars.size(); }
  std::vector<std::string> names() const; // sorted

private:
  std::unordered_map<std::string, std::string> m_vars;
};

/**
 * Replaces every `{Name}` in `tmpl` with env.get(Name).
 *
 * Single pass, left to right; substituted text is not scanned again, so a
 * value containing "{X}" is emitted as-is. Unknown names become "". A '{'
 * with no closing '}' is copied literally along with the rest of the text,
 * and of several '{' before one '}' only the last opens the placeholder, so
 * "x {a {B}" keeps "x {a " and substitutes B.
 */
std::string interpolate(const std::string &tmpl, const Environment &env);
