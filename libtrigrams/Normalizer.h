#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

// Converts raw UTF-8 text into a single line of lowercase tokens separated by
// single spaces. Tokens consist of unicode letters, marks, apostrophes and
// hyphens. Everything else (punctuation, digits, symbols, newlines) acts as a
// separator. Standalone apostrophes surrounded by whitespace are dropped.
// Throws text_size_error for input larger than MAX_TEXT_SIZE.
std::string normalize_text(std::string_view raw);

// Normalizes every line read from `in` separately and joins the non-empty
// results with single spaces.
std::string normalize_lines(std::istream &in);
