// SPDX-License-Identifier: MIT

#ifndef GBCONV_UTIL_HPP
#define GBCONV_UTIL_HPP

#include <string>

// Spaces, tabs and line breaks
bool isWhitespace(int c);
bool isDigit(int c);
// ASCII letters, digits and underscores
bool continuesIdentifier(int c);

// Checks the end of `str` against `suffix`, ignoring ASCII case
bool endsWithNoCase(std::string const &str, char const *suffix);

#endif // GBCONV_UTIL_HPP
