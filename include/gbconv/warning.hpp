// SPDX-License-Identifier: MIT

#ifndef GBCONV_WARNING_HPP
#define GBCONV_WARNING_HPP

#include <stdint.h>

enum WarningLevel {
	LEVEL_DEFAULT,    // Warnings that are enabled by default
	LEVEL_ALL,        // Warnings that probably indicate an error
	LEVEL_EVERYTHING, // Literally every warning
};

enum WarningID {
	WARNING_UNQUANTIZED,   // Encoding colors that are not in the palette
	WARNING_PARTIAL_TILES, // Image size is not a multiple of the tile size
	WARNING_TRANSPARENCY,  // Non-opaque pixels, whose alpha the tile data cannot store

	NB_WARNINGS,
};

enum WarningBehavior { DISABLED, ENABLED, ERROR };

enum FlagSetting { SETTING_UNSET, SETTING_OFF, SETTING_ON };

struct WarningFlagState {
	FlagSetting enabled = SETTING_UNSET;
	FlagSetting error = SETTING_UNSET;
};

struct Warnings {
	WarningFlagState flags[NB_WARNINGS];
	// What `-Wall` and `-Weverything` set, per warning they cover
	WarningFlagState groups[NB_WARNINGS];
	bool enabled = true;    // -w disables all warnings
	bool allErrors = false; // -Werror
	uint64_t nbErrors = 0;

	// Applies the argument of one `-W` option
	void processFlag(char const *flag);
	WarningBehavior behavior(WarningID id) const;
	void incrementErrors();
};

extern Warnings warnings;

// Warns about the command line; these are not governed by `-W` flags
[[gnu::format(printf, 1, 2)]]
void warnx(char const *fmt, ...);

// Warns the user about problems that don't prevent a valid conversion
[[gnu::format(printf, 2, 3)]]
void warning(WarningID id, char const *fmt, ...);

// Prints the error count, and exits with failure
[[noreturn]]
void giveUp();

// If any error has been emitted thus far, calls `giveUp()`
void requireZeroErrors();

// Prints an error, and increments the error count
[[gnu::format(printf, 1, 2)]]
void error(char const *fmt, ...);

// Prints a fatal error, increments the error count, and gives up
[[gnu::format(printf, 1, 2), noreturn]]
void fatal(char const *fmt, ...);

#endif // GBCONV_WARNING_HPP
