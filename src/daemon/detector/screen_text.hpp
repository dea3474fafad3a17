#pragma once

#include <string>
#include <string_view>
#include <vector>

// Helpers for the plain-text pane captures handed to the status detector.
namespace screen {

// Removes CSI/OSC escape sequences and stray control characters (tabs kept).
std::string strip_ansi(std::string_view text);

std::vector<std::string> split_lines(std::string_view text);

std::string trim(std::string_view s);

// True for lines made only of box-drawing characters (U+2500..U+257F) and spaces.
bool is_separator_line(std::string_view line);

// Drops leading/trailing vertical box borders (│ ┃) and surrounding whitespace.
std::string strip_box_border(std::string_view line);

// Leading UTF-8 codepoint of the string, or empty.
std::string_view first_codepoint(std::string_view s);

// The last `limit` lines that are neither blank nor separators, bottom line first, borders stripped.
std::vector<std::string> tail_lines(std::string_view text, int limit);

} // namespace screen
