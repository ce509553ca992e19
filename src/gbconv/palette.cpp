// SPDX-License-Identifier: MIT

#include "gbconv/palette.hpp"

#include <math.h>
#include <optional>
#include <stdint.h>

#include "gbconv/rgba.hpp"

double colorDistance(Rgb const &lhs, Rgb const &rhs) {
	int dr = lhs.red - rhs.red, dg = lhs.green - rhs.green, db = lhs.blue - rhs.blue;
	return sqrt(dr * dr + dg * dg + db * db);
}

uint8_t nearestPaletteIndex(uint8_t red, uint8_t green, uint8_t blue) {
	Rgb color{red, green, blue};
	uint8_t best = 0;
	double bestDistance = colorDistance(color, greenPalette[0]);

	for (uint8_t i = 1; i < greenPalette.size(); ++i) {
		// Strict comparison, so that the first of several equidistant colors is kept
		if (double distance = colorDistance(color, greenPalette[i]); distance < bestDistance) {
			best = i;
			bestDistance = distance;
		}
	}
	return best;
}

Rgb nearestPaletteColor(uint8_t red, uint8_t green, uint8_t blue) {
	return greenPalette[nearestPaletteIndex(red, green, blue)];
}

std::optional<uint8_t> exactPaletteIndex(uint8_t red, uint8_t green, uint8_t blue) {
	for (uint8_t i = 0; i < greenPalette.size(); ++i) {
		if (greenPalette[i] == Rgb{red, green, blue}) {
			return i;
		}
	}
	return std::nullopt;
}

uint8_t colorToIndex(uint8_t red, uint8_t green, uint8_t blue) {
	return exactPaletteIndex(red, green, blue).value_or(0);
}
