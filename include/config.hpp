#pragma once
#include <iostream>
#include <string>

constexpr const char *INDY_VERSION = "0.5.2";
constexpr const char *DEFAULT_CONFIG_PATH = "indy.cfg";

struct Config {
  bool verbose = false;
  bool show_banner = true;
  std::string prompt_separator = ": ";
  // The line terminator is always stripped; this also trims surrounding spaces.
  bool trim_prompt_input = false;
  // Where the CLI dumps recorded diagnostics after a run (empty = nowhere)
  std::string log_file;
};

// Reads `key value` lines from path. A missing file yields the defaults;
// entries that cannot be applied are skipped with a warning on `warn`.
Config load_config(const std::string &path, std::ostream &warn = std::cerr);

// Applies one `key value` pair. Returns false if the key is unknown or the
// value does not parse; cfg is left untouched in that case.
bool apply_config_entry(Config &cfg, const std::string &key, const std::string &value);
