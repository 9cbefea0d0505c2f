#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <ostream>
#include <optional>
#include <string>

static std::optional<bool> parse_bool(const std::string &value) {
  std::string v = to_lower(value);
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  return std::nullopt;
}

bool apply_config_entry(Config &cfg, const std::string &key, const std::string &value) {
  if (key == "verbose" || key == "show-banner" || key == "trim-prompt-input") {
    auto b = parse_bool(value);
    if (!b)
      return false;
    if (key == "verbose") cfg.verbose = *b;
    else if (key == "show-banner") cfg.show_banner = *b;
    else cfg.trim_prompt_input = *b;
    return true;
  }

  if (key == "prompt-separator") cfg.prompt_separator = value;
  else if (key == "log-file") cfg.log_file = value;
  else return false;

  return true;
}

Config load_config(const std::string &path, std::ostream &warn) {

  Config cfg{};
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return cfg;
  }

  std::string line;
  int line_no = 0;

  while (std::getline(in, line))
  {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    // key, then the rest of the line as the value ("prompt-separator ": "")
    size_t split_at = line.find_first_of(" \t");
    std::string key = line.substr(0, split_at);
    std::string value = split_at == std::string::npos ? "" : line.substr(split_at + 1);

    value = strip_quotes(value);

    if (!apply_config_entry(cfg, key, value)) {
      warn << "Warning: " << path << ":" << line_no << ": ignoring '" << key
                << "' (unknown key or invalid value '" << value << "').\n";
    }
  }

  return cfg;
}
