// SPDX-License-Identifier: MIT

#include "gbconv/tiles.hpp"

#include <optional>
#include <stdint.h>
#include <vector>

#include "helpers.hpp" // assume

#include "gbconv/image.hpp"
#include "gbconv/palette.hpp"
#include "gbconv/rgba.hpp"

TileGrid computeTileGrid(uint32_t width, uint32_t height) {
	// Written this way to avoid overflowing on widths close to `UINT32_MAX`
	return {
	    .width = width / TILE_WIDTH + (width % TILE_WIDTH != 0),
	    .height = height / TILE_HEIGHT + (height % TILE_HEIGHT != 0),
	};
}

class TileEncoder {
	uint32_t const _width, _height;
	std::vector<Rgba> const &_pixels;
	TileData &_data;

	uint8_t colorIndex(uint32_t x, uint32_t y) {
		if (x >= _width || y >= _height) {
			return 0; // Padding for partial tiles
		}
		Rgba const &pixel = _pixels[static_cast<size_t>(y) * _width + x];
		if (std::optional<uint8_t> index = exactPaletteIndex(pixel.red, pixel.green, pixel.blue);
		    index) {
			return *index;
		}
		if (_data.nbUnquantized++ == 0) {
			_data.firstUnquantizedX = x;
			_data.firstUnquantizedY = y;
		}
		return 0;
	}

public:
	TileEncoder(uint32_t width, uint32_t height, std::vector<Rgba> const &pixels, TileData &data)
	    : _width(width), _height(height), _pixels(pixels), _data(data) {}

	// Returns the low bitplane in the lower byte, and the high bitplane in the upper byte.
	// The leftmost pixel ends up in bit 7 of both.
	uint16_t rowBitplanes(uint32_t tileX, uint32_t tileY, uint32_t y) {
		uint16_t row = 0;
		for (uint32_t x = 0; x < TILE_WIDTH; ++x) {
			row <<= 1;
			uint8_t index = colorIndex(tileX * TILE_WIDTH + x, tileY * TILE_HEIGHT + y);
			if (index & 1) {
				row |= 1;
			}
			if (index & 2) {
				row |= 0x100;
			}
		}
		return row;
	}
};

Either<TileData, InvalidDimensions>
    encodeTiles(int64_t width, int64_t height, std::vector<Rgba> const &pixels) {
	if (std::optional<InvalidDimensions> invalid = checkDimensions(width, height, pixels.size());
	    invalid) {
		return *invalid;
	}

	TileData data{.bytes = {}, .grid = computeTileGrid(width, height)};
	data.bytes.reserve(data.grid.dataSize());

	TileEncoder encoder(width, height, pixels, data);
	for (uint32_t tileY = 0; tileY < data.grid.height; ++tileY) {
		for (uint32_t tileX = 0; tileX < data.grid.width; ++tileX) {
			for (uint32_t y = 0; y < TILE_HEIGHT; ++y) {
				uint16_t bitplanes = encoder.rowBitplanes(tileX, tileY, y);
				data.bytes.push_back(bitplanes & 0xFF);
				data.bytes.push_back(bitplanes >> 8);
			}
		}
	}
	assume(data.bytes.size() == data.grid.dataSize());

	return data;
}
