// SPDX-License-Identifier: MIT

#include "verbosity.hpp"

#include <stdarg.h>
#include <stdio.h>

#include "style.hpp"

static Verbosity verbosity = VERB_NONE; // One more level per `-v`

bool checkVerbosity(Verbosity level) {
	return level <= verbosity;
}

void incrementVerbosity() {
	// Extra `-v`s past the last level are harmless
	if (verbosity != VERB_TRACE) {
		verbosity = static_cast<Verbosity>(verbosity + 1);
	}
}

void printVerbosely(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	style_Set(stderr, STYLE_MAGENTA, false);
	vfprintf(stderr, fmt, ap);
	style_Reset(stderr);
	va_end(ap);
}
