// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <stdint.h>

#include "gbconv/palette.hpp"
#include "gbconv/rgba.hpp"

static bool isPaletteColor(Rgb const &color) {
	return std::find(greenPalette.begin(), greenPalette.end(), color) != greenPalette.end();
}

TEST(Palette, ColorDistanceIsEuclidean) {
	EXPECT_DOUBLE_EQ(colorDistance({0, 0, 0}, {0, 0, 0}), 0.0);
	EXPECT_DOUBLE_EQ(colorDistance({0, 0, 0}, {3, 4, 0}), 5.0);
	EXPECT_DOUBLE_EQ(colorDistance({10, 20, 30}, {7, 16, 30}), 5.0);
	EXPECT_DOUBLE_EQ(colorDistance({255, 0, 0}, {0, 0, 0}), colorDistance({0, 0, 0}, {255, 0, 0}));
}

TEST(Palette, NearestColorIsAlwaysAPaletteColor) {
	// Walk a coarse grid over the whole RGB cube, including both ends of every channel
	for (unsigned red = 0; red <= 255; red += 15) {
		for (unsigned green = 0; green <= 255; green += 15) {
			for (unsigned blue = 0; blue <= 255; blue += 15) {
				EXPECT_TRUE(isPaletteColor(nearestPaletteColor(red, green, blue)))
				    << "for (" << red << ", " << green << ", " << blue << ")";
			}
		}
	}
}

TEST(Palette, PaletteColorsMapToThemselves) {
	for (uint8_t i = 0; i < NB_PALETTE_COLORS; ++i) {
		Rgb const &color = greenPalette[i];
		EXPECT_EQ(nearestPaletteIndex(color.red, color.green, color.blue), i);
		EXPECT_EQ(nearestPaletteColor(color.red, color.green, color.blue), color);
	}
}

TEST(Palette, ExtremesMapToLightestAndDarkest) {
	EXPECT_EQ(nearestPaletteColor(155, 188, 15), greenPalette[0]);
	EXPECT_EQ(nearestPaletteColor(15, 56, 15), greenPalette[3]);
	EXPECT_EQ(nearestPaletteColor(255, 255, 255), greenPalette[0]);
	EXPECT_EQ(nearestPaletteColor(0, 0, 0), greenPalette[3]);
}

TEST(Palette, NearestColorOfArbitraryColors) {
	EXPECT_EQ(nearestPaletteIndex(100, 100, 100), 2);
	EXPECT_EQ(nearestPaletteIndex(150, 180, 20), 0);
	EXPECT_EQ(nearestPaletteIndex(40, 90, 40), 2);
	EXPECT_EQ(nearestPaletteIndex(140, 170, 16), 1);
}

TEST(Palette, TiesGoToTheLowestIndex) {
	// Halfway between colors #0 and #1
	Rgb between01{147, 180, 15};
	ASSERT_DOUBLE_EQ(
	    colorDistance(between01, greenPalette[0]), colorDistance(between01, greenPalette[1])
	);
	EXPECT_EQ(nearestPaletteIndex(between01.red, between01.green, between01.blue), 0);
	EXPECT_EQ(nearestPaletteColor(between01.red, between01.green, between01.blue), greenPalette[0]);

	// Equidistant from colors #2 and #3, and farther from the others
	Rgb between23{32, 77, 31};
	ASSERT_DOUBLE_EQ(
	    colorDistance(between23, greenPalette[2]), colorDistance(between23, greenPalette[3])
	);
	EXPECT_EQ(nearestPaletteIndex(between23.red, between23.green, between23.blue), 2);
}

TEST(Palette, ColorToIndexRoundTrips) {
	for (uint8_t i = 0; i < NB_PALETTE_COLORS; ++i) {
		Rgb const &color = greenPalette[i];
		EXPECT_EQ(colorToIndex(color.red, color.green, color.blue), i);
		EXPECT_EQ(exactPaletteIndex(color.red, color.green, color.blue), std::optional<uint8_t>(i));
	}
}

TEST(Palette, ColorsOutsideThePaletteFallBackToZero) {
	EXPECT_EQ(exactPaletteIndex(15, 56, 16), std::nullopt);
	EXPECT_EQ(colorToIndex(15, 56, 16), 0);
	EXPECT_EQ(exactPaletteIndex(0, 0, 0), std::nullopt);
	EXPECT_EQ(colorToIndex(0, 0, 0), 0);
}
