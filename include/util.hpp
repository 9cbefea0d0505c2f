#pragma once
#include <cstdio>
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string &s);
std::string to_lower(std::string s);

// Whitespace-separated tokens, like `iss >> tok` in a loop.
std::vector<std::string> split(const std::string &line);

// Splits raw source text into lines. Drops a trailing '\r' from each line and
// a UTF-8 byte order mark from the first one.
std::vector<std::string> split_lines(const std::string &text);

bool is_identifier(const std::string &s);

/**
 * Removes one pair of surrounding double quotes, if present.
 * The value is trimmed first; `"a"` becomes `a`, `"a` stays `"a`.
 */
std::string strip_quotes(const std::string &s);

bool is_quoted(const std::string &s);

//#define DEBUG
#define DEBUG_LEXER false
#define DEBUG_PARSER false
#define DEBUG_EXECUTOR false

#ifdef DEBUG
    #warning "Debug-printing is active"
    #define DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else
    #define DEBUG_PRINT(condition, msg, ...)
#endif
