#include "config.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static std::string write_cfg(const std::string &content) {
  fs::path p = fs::temp_directory_path() / "indy_test_config.cfg";
  std::ofstream out(p);
  out << content;
  return p.string();
}

int main() {
  std::cout << "Running config unit tests...\n";

  // === Test 1: defaults ===
  {
    Config cfg;
    assert(!cfg.verbose);
    assert(cfg.show_banner);
    assert(cfg.prompt_separator == ": ");
    assert(!cfg.trim_prompt_input);
    assert(cfg.log_file.empty());
    std::cout << "Test 1 passed: defaults.\n";
  }

  // === Test 2: missing file keeps defaults ===
  {
    Config cfg = load_config((fs::temp_directory_path() / "indy_does_not_exist.cfg").string());
    assert(!cfg.verbose);
    assert(cfg.prompt_separator == ": ");
    std::cout << "Test 2 passed: missing file.\n";
  }

  // === Test 3: values, comments, quotes ===
  {
    std::string path = write_cfg("# settings\n"
                                 "\n"
                                 "verbose yes\n"
                                 "show-banner OFF\n"
                                 "prompt-separator \" -> \"\n"
                                 "trim-prompt-input 1\n"
                                 "log-file indy.log\n");
    Config cfg = load_config(path);
    assert(cfg.verbose);
    assert(!cfg.show_banner);
    assert(cfg.prompt_separator == " -> ");
    assert(cfg.trim_prompt_input);
    assert(cfg.log_file == "indy.log");
    fs::remove(path);
    std::cout << "Test 3 passed: parsed values.\n";
  }

  // === Test 4: bad entries warn and keep defaults ===
  {
    std::string path = write_cfg("verbose maybe\nno-such-key 3\nshow-banner false\n");
    std::ostringstream warnings;
    Config cfg = load_config(path, warnings);
    assert(!cfg.verbose);
    assert(!cfg.show_banner);
    // one warning per rejected line, on the stream the caller passed
    const std::string text = warnings.str();
    assert(text.find(":1: ignoring 'verbose'") != std::string::npos);
    assert(text.find(":2: ignoring 'no-such-key'") != std::string::npos);
    assert(text.find(":3:") == std::string::npos);
    fs::remove(path);

    Config direct;
    assert(!apply_config_entry(direct, "verbose", "sometimes"));
    assert(!direct.verbose);
    assert(apply_config_entry(direct, "verbose", "True"));
    assert(direct.verbose);
    assert(!apply_config_entry(direct, "colour", "red"));
    std::cout << "Test 4 passed: invalid entries ignored.\n";
  }

  std::cout << "All config tests passed successfully.\n";
  return 0;
}
