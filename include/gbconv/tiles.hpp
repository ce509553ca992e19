// SPDX-License-Identifier: MIT

#ifndef GBCONV_TILES_HPP
#define GBCONV_TILES_HPP

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "either.hpp"

#include "gbconv/image.hpp"
#include "gbconv/rgba.hpp"

static constexpr uint8_t TILE_WIDTH = 8, TILE_HEIGHT = 8;
// Each row of a tile is a low bitplane byte, then a high bitplane byte
static constexpr size_t TILE_SIZE = TILE_HEIGHT * 2;

struct TileGrid {
	uint32_t width;  // In tiles
	uint32_t height; // In tiles

	uint64_t nbTiles() const { return static_cast<uint64_t>(width) * height; }
	uint64_t dataSize() const { return nbTiles() * TILE_SIZE; }
};

// Number of tiles needed to cover that many pixels; edge tiles may be partial
TileGrid computeTileGrid(uint32_t width, uint32_t height);

struct TileData {
	std::vector<uint8_t> bytes;
	TileGrid grid;

	// Pixels that were not one of the palette's colors, and have been encoded as color #0.
	// This happens when the image was not quantized first.
	uint64_t nbUnquantized = 0;
	uint32_t firstUnquantizedX = 0;
	uint32_t firstUnquantizedY = 0;
};

// Packs quantized pixels (in row-major order) into 2bpp tiles, in row-major order of tiles.
// Pixels past the right and bottom edges of the image are encoded as color #0.
Either<TileData, InvalidDimensions>
    encodeTiles(int64_t width, int64_t height, std::vector<Rgba> const &pixels);

#endif // GBCONV_TILES_HPP
