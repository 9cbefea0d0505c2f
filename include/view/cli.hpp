#pragma once
#include "config.hpp"
#include <iostream>
#include <string>
#include <vector>

enum ExitCode {
  EXIT_OK = 0,
  EXIT_SCRIPT_ERROR = 1,
  EXIT_USAGE_ERROR = 2,
};

/**
 * Command-line shell around the interpreter: flag parsing, config and file
 * loading, banner, and mapping the run result onto an exit code.
 */
class CLI {
public:
  CLI(std::vector<std::string> args, std::istream &in = std::cin,
      std::ostream &out = std::cout, std::ostream &err = std::cerr);
  int run(); // returns exit code

private:
  bool parse_args();
  void print_usage() const;
  bool read_script(std::string &source) const;

  std::vector<std::string> args_;
  std::istream &in_;
  std::ostream &out_;
  std::ostream &err_;

  Config cfg_;
  std::string script_path_;
  std::string config_path_{DEFAULT_CONFIG_PATH};
  bool verbose_flag_{false};
  bool show_help_{false};
  bool show_version_{false};
};
