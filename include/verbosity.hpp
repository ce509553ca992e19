// SPDX-License-Identifier: MIT

#ifndef GBCONV_VERBOSITY_HPP
#define GBCONV_VERBOSITY_HPP

// Prints to standard error if `-v` was given enough times; the arguments are only evaluated then
#define verbosePrint(level, ...) \
	do { \
		if (checkVerbosity(level)) { \
			printVerbosely(__VA_ARGS__); \
		} \
	} while (0)

enum Verbosity {
	VERB_NONE,   // 0. Only diagnostics and the summary
	VERB_CONFIG, // 1. Options and derived output paths, after parsing CLI options
	VERB_NOTICE, // 2. Each step of the conversion, and each file read or written
	VERB_INFO,   // 3. PNG properties and tile grid sizes
	VERB_DEBUG,  // 4. Pixel counts, listing identifier and date
	VERB_TRACE,  // 5. The bytes of every encoded tile
};

void incrementVerbosity();
bool checkVerbosity(Verbosity level);

[[gnu::format(printf, 1, 2)]]
void printVerbosely(char const *fmt, ...);

#endif // GBCONV_VERBOSITY_HPP
