// SPDX-License-Identifier: MIT

#ifndef GBCONV_RGBA_HPP
#define GBCONV_RGBA_HPP

#include <stdint.h>

// A color without any transparency information
struct Rgb {
	uint8_t red;
	uint8_t green;
	uint8_t blue;

	bool operator==(Rgb const &rhs) const = default;
};

struct Rgba {
	uint8_t red;
	uint8_t green;
	uint8_t blue;
	uint8_t alpha;

	Rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a) : red(r), green(g), blue(b), alpha(a) {}
	Rgba(Rgb const &rgb, uint8_t a) : red(rgb.red), green(rgb.green), blue(rgb.blue), alpha(a) {}
	/*
	 * Constructs the color from a "packed" RGBA representation (0xRRGGBBAA)
	 */
	explicit Rgba(uint32_t rgba = 0)
	    : red(rgba >> 24), green(rgba >> 16), blue(rgba >> 8), alpha(rgba) {}

	/*
	 * Returns this RGBA as a 32-bit number that can be printed in hex (`%08x`) to yield its CSS
	 * representation
	 */
	uint32_t toCSS() const {
		auto shl = [](uint8_t val, unsigned shift) { return static_cast<uint32_t>(val) << shift; };
		return shl(red, 24) | shl(green, 16) | shl(blue, 8) | shl(alpha, 0);
	}
	friend bool operator==(Rgba const &lhs, Rgba const &rhs) { return lhs.toCSS() == rhs.toCSS(); }

	Rgb rgb() const { return {red, green, blue}; }

	bool isOpaque() const { return alpha == 0xFF; }
};

#endif // GBCONV_RGBA_HPP
