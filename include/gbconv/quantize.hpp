// SPDX-License-Identifier: MIT

#ifndef GBCONV_QUANTIZE_HPP
#define GBCONV_QUANTIZE_HPP

#include <stdint.h>
#include <vector>

#include "either.hpp"

#include "gbconv/image.hpp"
#include "gbconv/rgba.hpp"

// Replaces the RGB of each pixel with the closest palette color, keeping its alpha.
// The pixels are in row-major order, and are returned in the same order.
Either<std::vector<Rgba>, InvalidDimensions>
    quantize(int64_t width, int64_t height, std::vector<Rgba> const &pixels);

#endif // GBCONV_QUANTIZE_HPP
