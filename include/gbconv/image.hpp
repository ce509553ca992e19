// SPDX-License-Identifier: MIT

#ifndef GBCONV_IMAGE_HPP
#define GBCONV_IMAGE_HPP

#include <optional>
#include <stddef.h>
#include <stdint.h>

// A pixel buffer whose size cannot be processed: a width or height that is not positive or does
// not fit in 32 bits, or a number of pixels that does not match them
struct InvalidDimensions {
	int64_t width;
	int64_t height;
	size_t nbPixels;
};

static inline std::optional<InvalidDimensions>
    checkDimensions(int64_t width, int64_t height, size_t nbPixels) {
	// Dividing avoids overflowing `width * height`
	if (width < 1 || height < 1 || width > UINT32_MAX || height > UINT32_MAX
	    || nbPixels % static_cast<uint64_t>(width) != 0
	    || nbPixels / static_cast<uint64_t>(width) != static_cast<uint64_t>(height)) {
		return InvalidDimensions{width, height, nbPixels};
	}
	return std::nullopt;
}

#endif // GBCONV_IMAGE_HPP
