// SPDX-License-Identifier: MIT

#include "gbconv/quantize.hpp"

#include <optional>
#include <stdint.h>
#include <vector>

#include "gbconv/image.hpp"
#include "gbconv/palette.hpp"
#include "gbconv/rgba.hpp"

Either<std::vector<Rgba>, InvalidDimensions>
    quantize(int64_t width, int64_t height, std::vector<Rgba> const &pixels) {
	if (std::optional<InvalidDimensions> invalid = checkDimensions(width, height, pixels.size());
	    invalid) {
		return *invalid;
	}

	std::vector<Rgba> quantized;
	quantized.reserve(pixels.size());
	for (Rgba const &pixel : pixels) {
		quantized.emplace_back(nearestPaletteColor(pixel.red, pixel.green, pixel.blue), pixel.alpha);
	}
	return quantized;
}
