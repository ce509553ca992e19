// SPDX-License-Identifier: MIT

#include "cli.hpp"

#include <errno.h>
#include <fstream>
#include <getopt.h>
#include <string.h>
#include <string>
#include <utility>
#include <vector>

#include "util.hpp" // isWhitespace

// At-files may include other at-files, but not endlessly
static constexpr unsigned MAX_AT_FILE_DEPTH = 32;

struct ParseContext {
	std::string shortOpts;
	option const *longOpts;
	void (*parseArg)(int, char *);
	Usage const &usage;
};

// Splits an at-file into whitespace-separated arguments; `#` comments out the rest of a line
static std::vector<std::string> readAtFile(char const *path, Usage const &usage) {
	std::filebuf file;
	if (!file.open(path, std::ios_base::in)) {
		usage.printAndExit("Error reading at-file \"%s\": %s", path, strerror(errno));
	}

	std::vector<std::string> args;
	std::string arg;
	bool inComment = false;
	for (int c; (c = file.sbumpc()) != std::filebuf::traits_type::eof();) {
		if (c == '\n' || c == '\r') {
			inComment = false;
		}
		if (inComment) {
			continue;
		}
		if (!isWhitespace(c)) {
			if (c == '#' && arg.empty()) {
				inComment = true;
			} else {
				arg.push_back(c);
			}
		} else if (!arg.empty()) {
			args.push_back(std::move(arg));
			arg.clear();
		}
	}
	if (!arg.empty()) {
		args.push_back(std::move(arg));
	}
	return args;
}

static void parseArgv(int argc, char *argv[], ParseContext const &ctx, unsigned depth);

static void parseAtFile(char *path, ParseContext const &ctx, unsigned depth) {
	if (depth == MAX_AT_FILE_DEPTH) {
		ctx.usage.printAndExit("At-file \"%s\" is nested too deeply", path);
	}

	std::vector<std::string> args = readAtFile(path, ctx.usage);
	// The at-file's name stands in for `argv[0]` in `getopt`'s messages
	std::vector<char *> argv{path};
	for (std::string &arg : args) {
		argv.push_back(arg.data());
	}
	argv.push_back(nullptr);

	optind = 0; // Makes `getopt` start over with the new argument vector
	parseArgv(argv.size() - 1, argv.data(), ctx, depth + 1);
}

static void parseArgv(int argc, char *argv[], ParseContext const &ctx, unsigned depth) {
	for (int ch; (ch = getopt_long_only(argc, argv, ctx.shortOpts.c_str(), ctx.longOpts, nullptr))
	             != -1;) {
		if (ch == 1 && optarg[0] == '@') {
			// `getopt` is between two arguments, so it can resume from there afterwards
			int resumeInd = optind;
			parseAtFile(&optarg[1], ctx, depth);
			optind = resumeInd;
		} else {
			ctx.parseArg(ch, optarg);
		}
	}

	// Anything after `--` is positional
	for (int i = optind; i < argc; ++i) {
		ctx.parseArg(1, argv[i]);
	}
}

void cli_ParseArgs(
    int argc,
    char *argv[],
    char const *shortOpts,
    option const *longOpts,
    void (*parseArg)(int, char *),
    Usage const &usage
) {
	// The leading '-' makes `getopt` return positional arguments in order, as option 1
	ParseContext ctx{std::string("-") + shortOpts, longOpts, parseArg, usage};
	parseArgv(argc, argv, ctx, 0);
}
