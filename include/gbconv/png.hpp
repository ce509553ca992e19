// SPDX-License-Identifier: MIT

#ifndef GBCONV_PNG_HPP
#define GBCONV_PNG_HPP

#include <stdint.h>
#include <streambuf>
#include <vector>

#include "gbconv/rgba.hpp"

struct Png {
	uint32_t width = 0, height = 0;
	std::vector<Rgba> pixels{};

	Png() {}
	// Decodes any kind of PNG image into RGBA8888 pixels, or dies trying
	Png(char const *filename, std::streambuf &file);

	// Encodes the pixels as an RGBA8888 PNG image, or dies trying
	void write(char const *filename, std::streambuf &file) const;
};

#endif // GBCONV_PNG_HPP
