// SPDX-License-Identifier: MIT

#include "util.hpp"

#include <string.h>
#include <string>

#include "platform.hpp" // strcasecmp

bool isWhitespace(int c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isDigit(int c) {
	return c >= '0' && c <= '9';
}

bool continuesIdentifier(int c) {
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || isDigit(c) || c == '_';
}

bool endsWithNoCase(std::string const &str, char const *suffix) {
	size_t len = strlen(suffix);
	return str.length() >= len && strcasecmp(&str[str.length() - len], suffix) == 0;
}
