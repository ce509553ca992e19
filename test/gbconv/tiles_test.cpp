// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>

#include <stdint.h>
#include <vector>

#include "either.hpp"

#include "gbconv/image.hpp"
#include "gbconv/palette.hpp"
#include "gbconv/quantize.hpp"
#include "gbconv/rgba.hpp"
#include "gbconv/tiles.hpp"

static Rgba shade(uint8_t index) {
	return Rgba(greenPalette[index], 0xFF);
}

static TileData encodeOrFail(uint32_t width, uint32_t height, std::vector<Rgba> const &pixels) {
	auto result = encodeTiles(width, height, pixels);
	if (!result.holds<TileData>()) {
		ADD_FAILURE() << "Encoding a " << width << "x" << height << " image failed";
		return {};
	}
	return result.get<TileData>();
}

TEST(Tiles, GridRoundsUp) {
	struct {
		uint32_t width, height, tilesX, tilesY;
	} cases[] = {
	    {1,   1,  1,  1 },
	    {5,   5,  1,  1 },
	    {8,   8,  1,  1 },
	    {9,   8,  2,  1 },
	    {16,  16, 2,  2 },
	    {17,  33, 3,  5 },
	    {160, 144, 20, 18},
	};
	for (auto const &c : cases) {
		TileGrid grid = computeTileGrid(c.width, c.height);
		EXPECT_EQ(grid.width, c.tilesX) << c.width << "x" << c.height;
		EXPECT_EQ(grid.height, c.tilesY) << c.width << "x" << c.height;
		EXPECT_EQ(grid.dataSize(), grid.nbTiles() * TILE_SIZE);
	}

	TileGrid huge = computeTileGrid(UINT32_MAX, 1);
	EXPECT_EQ(huge.width, UINT32_MAX / 8 + 1);
}

TEST(Tiles, DataSizeMatchesGrid) {
	for (uint32_t height = 1; height <= 17; height += 4) {
		for (uint32_t width = 1; width <= 25; width += 3) {
			std::vector<Rgba> pixels(width * height, shade(1));
			TileData data = encodeOrFail(width, height, pixels);
			uint64_t expected = ((width + 7) / 8) * ((height + 7) / 8) * 16;
			EXPECT_EQ(data.bytes.size(), expected) << width << "x" << height;
			EXPECT_EQ(data.grid.dataSize(), expected) << width << "x" << height;
		}
	}
}

TEST(Tiles, SolidDarkestTileSetsBothPlanes) {
	TileData data = encodeOrFail(8, 8, std::vector<Rgba>(64, shade(3)));

	ASSERT_EQ(data.bytes.size(), 16u);
	for (uint8_t byte : data.bytes) {
		EXPECT_EQ(byte, 0xFF);
	}
	EXPECT_EQ(data.nbUnquantized, 0u);
}

TEST(Tiles, SolidDarkTileOnlySetsHighPlane) {
	TileData data = encodeOrFail(8, 8, std::vector<Rgba>(64, shade(2)));

	ASSERT_EQ(data.bytes.size(), 16u);
	for (size_t i = 0; i < data.bytes.size(); i += 2) {
		EXPECT_EQ(data.bytes[i], 0x00) << "low byte of row " << i / 2;
		EXPECT_EQ(data.bytes[i + 1], 0xFF) << "high byte of row " << i / 2;
	}
}

TEST(Tiles, LeftmostPixelIsBit7) {
	std::vector<Rgba> pixels(64, shade(0));
	pixels[0] = shade(1);     // Row 0, leftmost column
	pixels[8 + 7] = shade(2); // Row 1, rightmost column
	pixels[16 + 3] = shade(3); // Row 2, fourth column
	TileData data = encodeOrFail(8, 8, pixels);

	std::vector<uint8_t> expected(16, 0x00);
	expected[0] = 0x80; // Row 0, low
	expected[3] = 0x01; // Row 1, high
	expected[4] = 0x10; // Row 2, low
	expected[5] = 0x10; // Row 2, high
	EXPECT_EQ(data.bytes, expected);
}

TEST(Tiles, PartialTilesArePaddedWithColor0) {
	TileData data = encodeOrFail(5, 5, std::vector<Rgba>(25, shade(3)));

	ASSERT_EQ(data.bytes.size(), 16u);
	EXPECT_EQ(data.grid.width, 1u);
	EXPECT_EQ(data.grid.height, 1u);
	for (size_t row = 0; row < 8; ++row) {
		uint8_t expected = row < 5 ? 0xF8 : 0x00;
		EXPECT_EQ(data.bytes[row * 2], expected) << "low byte of row " << row;
		EXPECT_EQ(data.bytes[row * 2 + 1], expected) << "high byte of row " << row;
	}
}

TEST(Tiles, TilesAreInRowMajorOrder) {
	// A 16x16 image whose four 8x8 quadrants each use a different color
	std::vector<Rgba> pixels;
	for (uint32_t y = 0; y < 16; ++y) {
		for (uint32_t x = 0; x < 16; ++x) {
			pixels.push_back(shade((y / 8) * 2 + x / 8));
		}
	}
	TileData data = encodeOrFail(16, 16, pixels);

	ASSERT_EQ(data.bytes.size(), 64u);
	EXPECT_EQ(data.grid.width, 2u);
	EXPECT_EQ(data.grid.height, 2u);
	EXPECT_EQ(data.grid.nbTiles(), 4u);
	uint8_t const expected[4][2] = {
	    {0x00, 0x00},
	    {0xFF, 0x00},
	    {0x00, 0xFF},
	    {0xFF, 0xFF},
	};
	for (size_t tile = 0; tile < 4; ++tile) {
		for (size_t row = 0; row < 8; ++row) {
			size_t ofs = tile * TILE_SIZE + row * 2;
			EXPECT_EQ(data.bytes[ofs], expected[tile][0]) << "tile " << tile << ", row " << row;
			EXPECT_EQ(data.bytes[ofs + 1], expected[tile][1]) << "tile " << tile << ", row " << row;
		}
	}
}

TEST(Tiles, QuantizedImageEncodesCleanly) {
	std::vector<Rgba> pixels;
	for (uint32_t i = 0; i < 16 * 16; ++i) {
		pixels.emplace_back(i & 0xFF, (i * 7) & 0xFF, (i * 13) & 0xFF, 0xFF);
	}
	auto quantized = quantize(16, 16, pixels);
	ASSERT_TRUE(quantized.holds<std::vector<Rgba>>());
	TileData data = encodeOrFail(16, 16, quantized.get<std::vector<Rgba>>());

	EXPECT_EQ(data.grid.nbTiles(), 4u);
	EXPECT_EQ(data.bytes.size(), 64u);
	EXPECT_EQ(data.nbUnquantized, 0u);
}

TEST(Tiles, ReportsUnquantizedPixels) {
	std::vector<Rgba> pixels(10 * 3, shade(3));
	pixels[1 * 10 + 9] = Rgba(1, 2, 3, 0xFF); // In the second tile
	pixels[2 * 10 + 4] = Rgba(255, 255, 255, 0xFF);
	pixels[2 * 10 + 5] = Rgba(0, 0, 0, 0xFF);
	TileData data = encodeOrFail(10, 3, pixels);

	EXPECT_EQ(data.nbUnquantized, 3u);
	// Pixels are visited tile by tile
	EXPECT_EQ(data.firstUnquantizedX, 4u);
	EXPECT_EQ(data.firstUnquantizedY, 2u);
	// Unquantized colors are encoded as color #0
	EXPECT_EQ(data.bytes[2 * 2], 0xF3);
	EXPECT_EQ(data.bytes[2 * 2 + 1], 0xF3);
	EXPECT_EQ(data.bytes[TILE_SIZE + 1 * 2], 0x80);
	EXPECT_EQ(data.bytes[TILE_SIZE + 1 * 2 + 1], 0x80);
}

TEST(Tiles, AlphaIsIgnored) {
	std::vector<Rgba> opaque(64, shade(1));
	std::vector<Rgba> transparent(64, Rgba(greenPalette[1], 0x00));

	EXPECT_EQ(encodeOrFail(8, 8, opaque).bytes, encodeOrFail(8, 8, transparent).bytes);
}

TEST(Tiles, RejectsInvalidDimensions) {
	std::vector<Rgba> pixels(6, shade(0));

	auto mismatch = encodeTiles(4, 2, pixels);
	ASSERT_TRUE(mismatch.holds<InvalidDimensions>());
	EXPECT_EQ(mismatch.get<InvalidDimensions>().width, 4);
	EXPECT_EQ(mismatch.get<InvalidDimensions>().height, 2);
	EXPECT_EQ(mismatch.get<InvalidDimensions>().nbPixels, 6u);

	EXPECT_TRUE(encodeTiles(0, 6, pixels).holds<InvalidDimensions>());
	EXPECT_TRUE(encodeTiles(6, 0, pixels).holds<InvalidDimensions>());
	EXPECT_TRUE(encodeTiles(-1, -6, pixels).holds<InvalidDimensions>());
	EXPECT_TRUE(encodeTiles(3, 2, pixels).holds<TileData>());
}
