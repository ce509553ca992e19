// SPDX-License-Identifier: MIT

#include "gbconv/warning.hpp"

#include <inttypes.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "style.hpp"

Warnings warnings;

static struct {
	char const *name;
	WarningLevel level;
} const warningFlags[NB_WARNINGS] = {
    {"unquantized",   LEVEL_DEFAULT   },
    {"partial-tiles", LEVEL_ALL       },
    {"transparency",  LEVEL_EVERYTHING},
};

// Sets `enabled` or `error` on every warning up to `level`
static void setGroup(Warnings &state, WarningLevel level, bool error, FlagSetting setting) {
	for (int id = 0; id < NB_WARNINGS; ++id) {
		if (warningFlags[id].level <= level) {
			(error ? state.groups[id].error : state.groups[id].enabled) = setting;
		}
	}
}

static bool skipPrefix(char const *&str, char const *prefix) {
	size_t len = strlen(prefix);
	if (strncmp(str, prefix, len) != 0) {
		return false;
	}
	str += len;
	return true;
}

void Warnings::processFlag(char const *flag) {
	if (!strcmp(flag, "error")) {
		allErrors = true;
		return;
	}
	if (!strcmp(flag, "no-error")) {
		allErrors = false;
		return;
	}

	bool isError = false;
	FlagSetting setting = SETTING_ON;
	if (skipPrefix(flag, "error=")) {
		isError = true;
	} else if (skipPrefix(flag, "no-error=")) {
		isError = true;
		setting = SETTING_OFF;
	} else if (skipPrefix(flag, "no-")) {
		setting = SETTING_OFF;
	}

	if (!strcmp(flag, "all")) {
		setGroup(*this, LEVEL_ALL, isError, setting);
		return;
	}
	if (!strcmp(flag, "everything")) {
		setGroup(*this, LEVEL_EVERYTHING, isError, setting);
		return;
	}

	for (int id = 0; id < NB_WARNINGS; ++id) {
		if (!strcmp(flag, warningFlags[id].name)) {
			WarningFlagState &state = flags[id];
			if (!isError) {
				state.enabled = setting;
			} else {
				state.error = setting;
				// `-Werror=<flag>` also enables the warning
				if (setting == SETTING_ON) {
					state.enabled = SETTING_ON;
				}
			}
			return;
		}
	}

	warnx("Unknown warning flag \"%s\"", flag);
}

WarningBehavior Warnings::behavior(WarningID id) const {
	WarningFlagState const &flag = flags[id];
	WarningFlagState const &group = groups[id];

	if (!enabled || flag.enabled == SETTING_OFF) {
		return DISABLED;
	}
	if (flag.error == SETTING_ON) {
		return ERROR;
	}
	if (flag.enabled != SETTING_ON) {
		// Only a group can have enabled this warning, unless it is on by default
		if (group.enabled == SETTING_OFF) {
			return DISABLED;
		}
		if (group.error == SETTING_ON) {
			return ERROR;
		}
		if (group.enabled != SETTING_ON && warningFlags[id].level != LEVEL_DEFAULT) {
			return DISABLED;
		}
	}
	return allErrors && flag.error != SETTING_OFF && group.error != SETTING_OFF ? ERROR : ENABLED;
}

void Warnings::incrementErrors() {
	// Avoid overflowing the error count
	if (nbErrors != UINT64_MAX) {
		++nbErrors;
	}
}

static void printDiagnostic(StyleColor color, char const *prefix, char const *fmt, va_list ap) {
	style_Set(stderr, color, true);
	fputs(prefix, stderr);
	style_Reset(stderr);
	vfprintf(stderr, fmt, ap);
}

void warnx(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	printDiagnostic(STYLE_YELLOW, "warning: ", fmt, ap);
	va_end(ap);
	putc('\n', stderr);
}

[[noreturn]]
void giveUp() {
	style_Set(stderr, STYLE_RED, true);
	fprintf(
	    stderr,
	    "Conversion aborted after %" PRIu64 " error%s\n",
	    warnings.nbErrors,
	    warnings.nbErrors == 1 ? "" : "s"
	);
	style_Reset(stderr);
	exit(1);
}

void requireZeroErrors() {
	if (warnings.nbErrors != 0) {
		giveUp();
	}
}

void error(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	printDiagnostic(STYLE_RED, "error: ", fmt, ap);
	va_end(ap);
	putc('\n', stderr);

	warnings.incrementErrors();
}

[[noreturn]]
void fatal(char const *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	printDiagnostic(STYLE_RED, "FATAL: ", fmt, ap);
	va_end(ap);
	putc('\n', stderr);

	warnings.incrementErrors();
	giveUp();
}

void warning(WarningID id, char const *fmt, ...) {
	char const *flag = warningFlags[id].name;
	va_list ap;

	switch (warnings.behavior(id)) {
	case DISABLED:
		break;

	case ENABLED:
		va_start(ap, fmt);
		printDiagnostic(STYLE_YELLOW, "warning: ", fmt, ap);
		va_end(ap);
		style_Set(stderr, STYLE_YELLOW, true);
		fprintf(stderr, " [-W%s]\n", flag);
		style_Reset(stderr);
		break;

	case ERROR:
		va_start(ap, fmt);
		printDiagnostic(STYLE_RED, "error: ", fmt, ap);
		va_end(ap);
		style_Set(stderr, STYLE_RED, true);
		fprintf(stderr, " [-Werror=%s]\n", flag);
		style_Reset(stderr);

		warnings.incrementErrors();
		break;
	}
}
