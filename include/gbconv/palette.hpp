// SPDX-License-Identifier: MIT

#ifndef GBCONV_PALETTE_HPP
#define GBCONV_PALETTE_HPP

#include <array>
#include <optional>
#include <stddef.h>
#include <stdint.h>

#include "gbconv/rgba.hpp"

static constexpr size_t NB_PALETTE_COLORS = 4;

// The four shades of the original handheld's screen, from lightest (color #0) to darkest (#3).
// The order matters: it is the order in which ties are broken, and the 2bpp color indices.
static constexpr std::array<Rgb, NB_PALETTE_COLORS> greenPalette{{
    {155, 188, 15},
    {139, 172, 15},
    {48,  98,  48},
    {15,  56,  15},
}};

// Euclidean distance in RGB space, without any weighting
double colorDistance(Rgb const &lhs, Rgb const &rhs);

// Returns the index of the palette color closest to (r, g, b); ties go to the lowest index
uint8_t nearestPaletteIndex(uint8_t red, uint8_t green, uint8_t blue);
Rgb nearestPaletteColor(uint8_t red, uint8_t green, uint8_t blue);

// Returns the index of the palette color that is exactly (r, g, b), if there is one
std::optional<uint8_t> exactPaletteIndex(uint8_t red, uint8_t green, uint8_t blue);
// Same, but colors outside of the palette are treated as color #0
uint8_t colorToIndex(uint8_t red, uint8_t green, uint8_t blue);

#endif // GBCONV_PALETTE_HPP
