// SPDX-License-Identifier: MIT

#include "gbconv/png.hpp"

#include <errno.h>
#include <inttypes.h>
#include <png.h>
#include <stdint.h>
#include <stdio.h>
#include <streambuf>
#include <string.h>
#include <vector>

#include "helpers.hpp" // assume, Defer
#include "verbosity.hpp"

#include "gbconv/rgba.hpp"
#include "gbconv/warning.hpp"

static constexpr size_t SIGNATURE_SIZE = 8;

// What libpng's I/O and error callbacks get to see
struct PngStream {
	char const *filename;
	std::streambuf &file;
	char const *action; // "reading" or "writing"
};

static PngStream &streamOf(png_structp png, bool forIO) {
	return *static_cast<PngStream *>(forIO ? png_get_io_ptr(png) : png_get_error_ptr(png));
}

[[noreturn]]
static void onPngError(png_structp png, char const *msg) {
	PngStream &stream = streamOf(png, false);
	fatal("libpng error while %s PNG image (\"%s\"): %s", stream.action, stream.filename, msg);
}

static void onPngWarning(png_structp png, char const *msg) {
	PngStream &stream = streamOf(png, false);
	warnx("libpng warning while %s PNG image (\"%s\"): %s", stream.action, stream.filename, msg);
}

static void readBytes(png_structp png, png_bytep data, size_t length) {
	PngStream &stream = streamOf(png, true);
	std::streamsize nbRead = stream.file.sgetn(reinterpret_cast<char *>(data), length);

	if (nbRead != static_cast<std::streamsize>(length)) {
		fatal("PNG image \"%s\" is truncated", stream.filename);
	}
}

static void writeBytes(png_structp png, png_bytep data, size_t length) {
	PngStream &stream = streamOf(png, true);

	if (stream.file.sputn(reinterpret_cast<char const *>(data), length)
	    != static_cast<std::streamsize>(length)) {
		fatal("Failed to write PNG image \"%s\": %s", stream.filename, strerror(errno));
	}
}

static void flushBytes(png_structp png) {
	PngStream &stream = streamOf(png, true);

	if (stream.file.pubsync() != 0) {
		fatal("Failed to write PNG image \"%s\": %s", stream.filename, strerror(errno));
	}
}

Png::Png(char const *filename, std::streambuf &file) {
	PngStream stream{filename, file, "reading"};

	verbosePrint(VERB_NOTICE, "Reading PNG file \"%s\"\n", filename);

	png_byte signature[SIGNATURE_SIZE];
	if (file.sgetn(reinterpret_cast<char *>(signature), SIGNATURE_SIZE)
	        != static_cast<std::streamsize>(SIGNATURE_SIZE)
	    || png_sig_cmp(signature, 0, SIGNATURE_SIZE) != 0) {
		fatal("File \"%s\" is not a valid PNG image", filename);
	}

	png_structp png =
	    png_create_read_struct(PNG_LIBPNG_VER_STRING, &stream, onPngError, onPngWarning);
	if (!png) {
		fatal("Failed to create PNG read structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}
	png_infop info = png_create_info_struct(png);
	Defer destroyPng{[&] { png_destroy_read_struct(&png, info ? &info : nullptr, nullptr); }};
	if (!info) {
		fatal("Failed to create PNG info structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}

	png_set_read_fn(png, &stream, readBytes);
	png_set_sig_bytes(png, SIGNATURE_SIZE);
	png_read_info(png, info);

	int bitDepth, colorType, interlaceType;
	png_get_IHDR(
	    png, info, &width, &height, &bitDepth, &colorType, &interlaceType, nullptr, nullptr
	);
	verbosePrint(
	    VERB_INFO,
	    "PNG image: %" PRIu32 "x%" PRIu32 " pixels, color type %d at %d bits%s\n",
	    width,
	    height,
	    colorType,
	    bitDepth,
	    interlaceType == PNG_INTERLACE_NONE ? "" : ", interlaced"
	);

	// Whatever the source format, have libpng hand out RGBA8888 rows:
	// palettes and low bit depths are expanded, tRNS becomes alpha
	png_set_expand(png);
	png_set_scale_16(png);
	png_set_gray_to_rgb(png);
	if (!(colorType & PNG_COLOR_MASK_ALPHA) && !png_get_valid(png, info, PNG_INFO_tRNS)) {
		png_set_add_alpha(png, 0xFFFF, PNG_FILLER_AFTER);
	}
	png_set_interlace_handling(png);
	png_read_update_info(png, info);
	assume(png_get_color_type(png, info) == PNG_COLOR_TYPE_RGBA);
	assume(png_get_bit_depth(png, info) == 8);

	size_t rowSize = static_cast<size_t>(width) * 4;
	std::vector<png_byte> image(rowSize * height);
	std::vector<png_bytep> rows(height);
	for (uint32_t y = 0; y < height; ++y) {
		rows[y] = &image[y * rowSize];
	}
	png_read_image(png, rows.data());
	png_read_end(png, nullptr);

	pixels.reserve(static_cast<size_t>(width) * height);
	for (size_t i = 0; i < image.size(); i += 4) {
		pixels.emplace_back(image[i], image[i + 1], image[i + 2], image[i + 3]);
	}
}

void Png::write(char const *filename, std::streambuf &file) const {
	PngStream stream{filename, file, "writing"};

	verbosePrint(VERB_NOTICE, "Writing PNG file \"%s\"\n", filename);
	assume(pixels.size() == static_cast<size_t>(width) * height);

	png_structp png =
	    png_create_write_struct(PNG_LIBPNG_VER_STRING, &stream, onPngError, onPngWarning);
	if (!png) {
		fatal("Failed to create PNG write structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}
	png_infop info = png_create_info_struct(png);
	Defer destroyPng{[&] { png_destroy_write_struct(&png, info ? &info : nullptr); }};
	if (!info) {
		fatal("Failed to create PNG info structure: %s", strerror(errno)); // LCOV_EXCL_LINE
	}

	png_set_write_fn(png, &stream, writeBytes, flushBytes);
	png_set_IHDR(
	    png,
	    info,
	    width,
	    height,
	    8,
	    PNG_COLOR_TYPE_RGB_ALPHA,
	    PNG_INTERLACE_NONE,
	    PNG_COMPRESSION_TYPE_DEFAULT,
	    PNG_FILTER_TYPE_DEFAULT
	);
	png_write_info(png, info);

	std::vector<png_byte> row(static_cast<size_t>(width) * 4);
	for (uint32_t y = 0; y < height; ++y) {
		Rgba const *pixel = &pixels[static_cast<size_t>(y) * width];
		for (png_byte *ptr = row.data(); ptr != row.data() + row.size(); ++pixel) {
			*ptr++ = pixel->red;
			*ptr++ = pixel->green;
			*ptr++ = pixel->blue;
			*ptr++ = pixel->alpha;
		}
		png_write_row(png, row.data());
	}
	png_write_end(png, info);
}
