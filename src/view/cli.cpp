#include "view/cli.hpp"
#include "diagnostics.hpp"
#include "interpreter.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

static void print_banner(std::ostream &out) {
  out << "--- Indy-lang Interpreter v" << INDY_VERSION << " ---\n";
}

CLI::CLI(std::vector<std::string> args, std::istream &in, std::ostream &out, std::ostream &err)
    : args_(std::move(args)), in_(in), out_(out), err_(err) {}

void CLI::print_usage() const {
  err_ << "Usage: indy <filepath.indy> [--verbose] [--config <path>]\n"
       << "  --verbose        show engine diagnostics while running\n"
       << "  --config <path>  settings file (default: " << DEFAULT_CONFIG_PATH << ")\n"
       << "  --version        print the interpreter version\n"
       << "  --help           show this message\n";
}

// args_[0] is the program name. The first non-flag argument is the script.
bool CLI::parse_args() {
  for (size_t i = 1; i < args_.size(); ++i) {
    const std::string &arg = args_[i];

    if (arg == "--verbose") {
      verbose_flag_ = true;
    } else if (arg == "--config") {
      if (i + 1 >= args_.size()) {
        err_ << "Error: --config requires a path.\n";
        return false;
      }
      config_path_ = args_[++i];
    } else if (arg == "--help") {
      show_help_ = true;
    } else if (arg == "--version") {
      show_version_ = true;
    } else if (arg.rfind("--", 0) == 0) {
      err_ << "Error: unknown option '" << arg << "'.\n";
      return false;
    } else if (script_path_.empty()) {
      script_path_ = arg;
    }
  }
  return true;
}

bool CLI::read_script(std::string &source) const {
  std::ifstream file(script_path_, std::ios::in | std::ios::binary);
  if (!file) {
    err_ << "[Error] Could not read file " << script_path_ << ": " << std::strerror(errno)
         << "\n";
    return false;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  source = ss.str();
  return true;
}

int CLI::run() {
  if (!parse_args()) {
    print_usage();
    return EXIT_USAGE_ERROR;
  }
  if (show_help_) {
    print_usage();
    return EXIT_OK;
  }
  if (show_version_) {
    out_ << "indy " << INDY_VERSION << "\n";
    return EXIT_OK;
  }

  cfg_ = load_config(config_path_, err_);
  if (verbose_flag_)
    cfg_.verbose = true;

  if (cfg_.show_banner)
    print_banner(out_);

  if (script_path_.empty()) {
    err_ << "Error: Missing input file.\n";
    print_usage();
    return EXIT_USAGE_ERROR;
  }

  std::string source;
  if (!read_script(source))
    return EXIT_USAGE_ERROR;

  Diagnostics diag(cfg_.verbose, &out_);
  Interpreter interp(cfg_, in_, out_, diag);
  RunResult result = interp.run(source);

  if (!cfg_.log_file.empty() && !diag.write_log(cfg_.log_file))
    err_ << "Warning: could not write diagnostics to " << cfg_.log_file << "\n";

  if (!result.ok()) {
    err_ << "[Error] line " << result.error_line << ": " << result.error << "\n";
    return EXIT_SCRIPT_ERROR;
  }
  return EXIT_OK;
}
