// SPDX-License-Identifier: MIT

#include "style.hpp"

#include <stdio.h>
#include <stdlib.h> // getenv
#include <string.h>

#include "platform.hpp" // fileno, isatty, strcasecmp

enum ColorChoice { COLOR_AUTO, COLOR_ALWAYS, COLOR_NEVER };

static ColorChoice colorOption = COLOR_AUTO; // --color

static bool isEnvSet(char const *name) {
	char const *value = getenv(name);
	return value && strcmp(value, "") != 0 && strcmp(value, "0") != 0;
}

static bool useColor(FILE *file) {
	// `--color` beats `FORCE_COLOR`, which beats `NO_COLOR`, which beats checking for a terminal
	static ColorChoice const colorEnv = isEnvSet("FORCE_COLOR") ? COLOR_ALWAYS
	                                    : isEnvSet("NO_COLOR")  ? COLOR_NEVER
	                                                            : COLOR_AUTO;
	ColorChoice choice = colorOption != COLOR_AUTO ? colorOption : colorEnv;

	return choice == COLOR_AUTO ? isatty(fileno(file)) : choice == COLOR_ALWAYS;
}

bool style_Parse(char const *arg) {
	static struct {
		char const *name;
		ColorChoice choice;
	} const choices[] = {
	    {"always", COLOR_ALWAYS},
	    {"never",  COLOR_NEVER },
	    {"auto",   COLOR_AUTO  },
	};

	for (auto const &[name, choice] : choices) {
		if (strcasecmp(arg, name) == 0) {
			colorOption = choice;
			return true;
		}
	}
	return false;
}

void style_Set(FILE *file, StyleColor color, bool bold) {
	if (useColor(file)) {
		// Bright colors for bold text
		fprintf(file, "\033[%dm", (bold ? 90 : 30) + color);
	}
}

void style_Reset(FILE *file) {
	if (useColor(file)) {
		fputs("\033[m", file);
	}
}
