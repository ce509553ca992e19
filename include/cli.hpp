// SPDX-License-Identifier: MIT

#ifndef GBCONV_CLI_HPP
#define GBCONV_CLI_HPP

#include <getopt.h> // option

#include "usage.hpp"

// Parses `argv` with `getopt_long_only`, expanding `@<file>` arguments in place.
// `parseArg` receives each option character, or 1 for positional arguments.
void cli_ParseArgs(
    int argc,
    char *argv[],
    char const *shortOpts,
    option const *longOpts,
    void (*parseArg)(int, char *),
    Usage const &usage
);

#endif // GBCONV_CLI_HPP
