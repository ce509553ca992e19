// SPDX-License-Identifier: MIT

#ifndef GBCONV_USAGE_HPP
#define GBCONV_USAGE_HPP

#include <utility>
#include <vector>

struct Usage {
	char const *name;
	char const *synopsis; // Everything after the program name, possibly over several lines
	std::vector<std::pair<char const *, char const *>> options; // Option forms, then what they do

	[[noreturn]]
	void printAndExit(int code) const;

	// Prints a fatal error, then the usage
	[[gnu::format(printf, 2, 3), noreturn]]
	void printAndExit(char const *fmt, ...) const;
};

#endif // GBCONV_USAGE_HPP
