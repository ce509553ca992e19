// SPDX-License-Identifier: MIT

#ifndef GBCONV_MAIN_HPP
#define GBCONV_MAIN_HPP

#include <string>

struct Options {
	bool encodeOnly = false; // -E
	bool gbdk = false;       // -g, -G
	bool quiet = false;      // -q
	bool timestamp = true;   // -T

	std::string listing{};  // -G
	std::string varName{};  // -n
	std::string tileData{}; // -o

	std::string input{};  // positional arg
	std::string output{}; // positional arg
};

extern Options options;

#endif // GBCONV_MAIN_HPP
