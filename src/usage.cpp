// SPDX-License-Identifier: MIT

#include "usage.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "style.hpp"

void Usage::printAndExit(int code) const {
	FILE *file = code ? stderr : stdout;

	style_Set(file, STYLE_GREEN, true);
	fputs("Usage: ", file);
	style_Set(file, STYLE_CYAN, true);
	fputs(name, file);
	style_Set(file, STYLE_CYAN, false);
	fprintf(file, " %s\n", synopsis);
	style_Reset(file);

	if (!options.empty()) {
		int width = 0;
		for (auto const &[forms, description] : options) {
			if (int len = strlen(forms); len > width) {
				width = len;
			}
		}

		style_Set(file, STYLE_GREEN, true);
		fputs("\nOptions:\n", file);
		style_Reset(file);
		for (auto const &[forms, description] : options) {
			style_Set(file, STYLE_CYAN, false);
			fprintf(file, "    %-*s", width, forms);
			style_Reset(file);
			fprintf(file, "  %s\n", description);
		}
	}

	exit(code);
}

void Usage::printAndExit(char const *fmt, ...) const {
	va_list ap;
	style_Set(stderr, STYLE_RED, true);
	fputs("FATAL: ", stderr);
	style_Reset(stderr);
	va_start(ap, fmt);
	vfprintf(stderr, fmt, ap);
	va_end(ap);
	fputs("\n\n", stderr);

	printAndExit(1);
}
