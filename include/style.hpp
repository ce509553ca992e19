// SPDX-License-Identifier: MIT

#ifndef GBCONV_STYLE_HPP
#define GBCONV_STYLE_HPP

#include <stdio.h>

// ANSI SGR color numbers
enum StyleColor {
	STYLE_RED = 1,
	STYLE_GREEN = 2,
	STYLE_YELLOW = 3,
	STYLE_MAGENTA = 5,
	STYLE_CYAN = 6,
};

// Parses the argument of `--color`; returns false if it is not "always", "never" or "auto"
bool style_Parse(char const *arg);
void style_Set(FILE *file, StyleColor color, bool bold);
void style_Reset(FILE *file);

#endif // GBCONV_STYLE_HPP
