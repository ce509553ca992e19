// SPDX-License-Identifier: MIT

#include "gbconv/process.hpp"

#include <errno.h>
#include <inttypes.h>
#include <ios>
#include <optional>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include <time.h>
#include <utility>
#include <vector>

#include "either.hpp"
#include "file.hpp"
#include "util.hpp" // endsWithNoCase, isDigit
#include "verbosity.hpp"

#include "gbconv/image.hpp"
#include "gbconv/listing.hpp"
#include "gbconv/main.hpp"
#include "gbconv/paths.hpp"
#include "gbconv/png.hpp"
#include "gbconv/quantize.hpp"
#include "gbconv/rgba.hpp"
#include "gbconv/tiles.hpp"
#include "gbconv/warning.hpp"

Options options;

[[noreturn]]
static void dimensionsError(InvalidDimensions const &dims) {
	fatal(
	    "Image of %" PRId64 "x%" PRId64 " pixels cannot be converted (got %zu pixels)",
	    dims.width,
	    dims.height,
	    dims.nbPixels
	);
}

static std::string currentTimestamp() {
	time_t now = time(nullptr);
	struct tm utc;
	char buf[sizeof("YYYY-MM-DDTHH:MM:SSZ")];

	if (now == static_cast<time_t>(-1) || !gmtime_r(&now, &utc)
	    || strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc) == 0) {
		fatal("Failed to get the current date: %s", strerror(errno));
	}
	return buf;
}

static Png readInput() {
	File input;
	if (!input.open(options.input, std::ios_base::in | std::ios_base::binary)) {
		fatal("Failed to open input image (\"%s\"): %s", input.name(), strerror(errno));
	}
	return Png(input.name(), *input);
}

static void writeImage(Png const &png) {
	File output;
	if (!output.open(options.output, std::ios_base::out | std::ios_base::binary)) {
		fatal("Failed to create \"%s\": %s", output.name(), strerror(errno));
	}
	png.write(output.name(), *output);
	if (!output.close()) {
		fatal("Failed to write \"%s\": %s", output.name(), strerror(errno));
	}
}

static void writeBytes(std::string const &path, char const *data, size_t size) {
	File output;
	if (!output.open(path, std::ios_base::out | std::ios_base::binary)) {
		fatal("Failed to create \"%s\": %s", output.name(), strerror(errno));
	}
	if (output->sputn(data, size) != static_cast<std::streamsize>(size) || !output.close()) {
		fatal("Failed to write \"%s\": %s", output.name(), strerror(errno));
	}
}

static void checkImage(Png const &png) {
	if (png.width % TILE_WIDTH != 0 || png.height % TILE_HEIGHT != 0) {
		warning(
		    WARNING_PARTIAL_TILES,
		    "Image size (%" PRIu32 "x%" PRIu32 ") is not a multiple of %" PRIu8 "x%" PRIu8
		    "; edge tiles will be padded with color #0",
		    png.width,
		    png.height,
		    TILE_WIDTH,
		    TILE_HEIGHT
		);
	}

	for (size_t i = 0; i < png.pixels.size(); ++i) {
		if (!png.pixels[i].isOpaque()) {
			warning(
			    WARNING_TRANSPARENCY,
			    "Pixel (%zu, %zu) is not fully opaque; transparency cannot be encoded in tiles",
			    i % png.width,
			    i / png.width
			);
			break;
		}
	}
}

static TileData encodeImage(Png const &png) {
	Either<TileData, InvalidDimensions> result = encodeTiles(png.width, png.height, png.pixels);
	if (result.holds<InvalidDimensions>()) {
		dimensionsError(result.get<InvalidDimensions>());
	}
	TileData &tileData = result.get<TileData>();

	if (tileData.nbUnquantized != 0) {
		Rgba const &color =
		    png.pixels[static_cast<size_t>(tileData.firstUnquantizedY) * png.width
		               + tileData.firstUnquantizedX];
		warning(
		    WARNING_UNQUANTIZED,
		    "%" PRIu64 " pixel%s not in the palette and %s encoded as color #0 "
		    "(first at (%" PRIu32 ", %" PRIu32 "), #%08" PRIx32 ")",
		    tileData.nbUnquantized,
		    tileData.nbUnquantized == 1 ? " is" : "s are",
		    tileData.nbUnquantized == 1 ? "was" : "were",
		    tileData.firstUnquantizedX,
		    tileData.firstUnquantizedY,
		    color.toCSS()
		);
	}

	verbosePrint(
	    VERB_INFO,
	    "Encoded %" PRIu64 " tiles (%" PRIu32 "x%" PRIu32 "), %zu bytes\n",
	    tileData.grid.nbTiles(),
	    tileData.grid.width,
	    tileData.grid.height,
	    tileData.bytes.size()
	);
	if (checkVerbosity(VERB_TRACE)) {
		for (size_t ofs = 0; ofs < tileData.bytes.size(); ofs += TILE_SIZE) {
			fprintf(stderr, "Tile #%zu:", ofs / TILE_SIZE);
			for (size_t i = 0; i < TILE_SIZE; ++i) {
				fprintf(stderr, " %02" PRIx8, tileData.bytes[ofs + i]);
			}
			putc('\n', stderr);
		}
	}

	return std::move(tileData);
}

static std::string renderImageListing(Png const &png, TileData const &tileData) {
	std::string baseName = listingIdentifier(options);
	if (!baseName.empty() && isDigit(baseName[0])) {
		warnx(
		    "Identifier \"%s\" starts with a digit, so the listing is not valid C; "
		    "use '-n' to name it",
		    baseName.c_str()
		);
	}
	std::optional<std::string> timestamp;
	if (options.timestamp) {
		timestamp = currentTimestamp();
	}

	verbosePrint(
	    VERB_DEBUG,
	    "Listing identifier: %s, date: %s\n",
	    baseName.c_str(),
	    timestamp ? timestamp->c_str() : "(none)"
	);
	return renderListing(
	    tileData.bytes,
	    png.width,
	    png.height,
	    tileData.grid.width,
	    tileData.grid.height,
	    baseName,
	    timestamp
	);
}

void process() {
	if (!endsWithNoCase(options.input, ".png")) {
		fatal("Input file \"%s\" must be a PNG image", options.input.c_str());
	}

	Png png = readInput();

	bool encoding = options.gbdk || !options.tileData.empty();
	if (encoding) {
		checkImage(png);
	}

	if (!options.encodeOnly) {
		verbosePrint(VERB_NOTICE, "Quantizing to the green palette...\n");
		Either<std::vector<Rgba>, InvalidDimensions> result =
		    quantize(png.width, png.height, png.pixels);
		if (result.holds<InvalidDimensions>()) {
			dimensionsError(result.get<InvalidDimensions>());
		}
		png.pixels = std::move(result.get<std::vector<Rgba>>());
		verbosePrint(VERB_DEBUG, "Quantized %zu pixels\n", png.pixels.size());
	}

	std::optional<TileData> tileData;
	if (encoding) {
		verbosePrint(VERB_NOTICE, "Encoding tiles...\n");
		tileData = encodeImage(png);
	}

	std::string listing;
	if (options.gbdk) {
		listing = renderImageListing(png, *tileData);
	}

	// Warnings promoted to errors must not leave partial outputs behind
	requireZeroErrors();

	if (!options.encodeOnly) {
		writeImage(png);
	}
	if (options.gbdk) {
		verbosePrint(VERB_NOTICE, "Writing GBDK listing \"%s\"...\n", options.listing.c_str());
		writeBytes(options.listing, listing.data(), listing.size());
	}
	if (!options.tileData.empty()) {
		verbosePrint(VERB_NOTICE, "Writing tile data \"%s\"...\n", options.tileData.c_str());
		writeBytes(
		    options.tileData,
		    reinterpret_cast<char const *>(tileData->bytes.data()),
		    tileData->bytes.size()
		);
	}

	if (options.quiet) {
		return;
	}
	// The summary would get mixed up with any data written to standard output
	FILE *summary = options.output == "-" || options.tileData == "-" || options.listing == "-"
	                    ? stderr
	                    : stdout;
	if (!options.encodeOnly) {
		fprintf(summary, "Converted image: %s\n", options.output.c_str());
	}
	if (options.gbdk) {
		fprintf(summary, "GBDK listing: %s\n", options.listing.c_str());
	}
	if (!options.tileData.empty()) {
		fprintf(summary, "Tile data: %s\n", options.tileData.c_str());
	}
	if (tileData) {
		fprintf(
		    summary,
		    "Tiles generated: %" PRIu64 " (%" PRIu32 "x%" PRIu32 "), %zu bytes\n",
		    tileData->grid.nbTiles(),
		    tileData->grid.width,
		    tileData->grid.height,
		    tileData->bytes.size()
		);
	}
}
