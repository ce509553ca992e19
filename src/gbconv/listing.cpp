// SPDX-License-Identifier: MIT

#include "gbconv/listing.hpp"

#include <ctype.h>
#include <inttypes.h>
#include <optional>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <string>
#include <vector>

#include "util.hpp" // continuesIdentifier

// Number of array values per line of the listing
static constexpr size_t VALUES_PER_LINE = 8;

[[gnu::format(printf, 2, 3)]]
static void appendf(std::string &str, char const *fmt, ...) {
	va_list ap, ap2;
	va_start(ap, fmt);
	va_copy(ap2, ap);
	int len = vsnprintf(nullptr, 0, fmt, ap);
	va_end(ap);

	size_t oldSize = str.size();
	str.resize(oldSize + len + 1); // `vsnprintf` always writes a terminator
	vsnprintf(&str[oldSize], len + 1, fmt, ap2);
	va_end(ap2);
	str.resize(oldSize + len);
}

std::string sanitizeIdentifier(std::string const &name) {
	std::string identifier = name;
	for (char &c : identifier) {
		if (!continuesIdentifier(static_cast<unsigned char>(c))) {
			c = '_';
		}
	}
	return identifier;
}

std::string baseNameFromPath(std::string const &path) {
	size_t start = path.find_last_of("/\\");
	start = start == path.npos ? 0 : start + 1;

	// A leading dot starts a hidden file's name, not an extension
	size_t end = path.rfind('.');
	if (end == path.npos || end <= start) {
		end = path.size();
	}
	return sanitizeIdentifier(path.substr(start, end - start));
}

std::string renderListing(
    std::vector<uint8_t> const &bytes,
    uint32_t width,
    uint32_t height,
    uint32_t tileCountX,
    uint32_t tileCountY,
    std::string const &baseName,
    std::optional<std::string> const &timestamp
) {
	std::string name = sanitizeIdentifier(baseName);
	if (name.empty()) {
		name = "image";
	}
	std::string upperName = name;
	for (char &c : upperName) {
		c = toupper(static_cast<unsigned char>(c));
	}
	uint64_t nbTiles = static_cast<uint64_t>(tileCountX) * tileCountY;

	std::string text;
	text += "// Automatically generated Sprite/Tile\n";
	appendf(
	    text,
	    "// Dimensions: %" PRIu32 "x%" PRIu32 " pixels (%" PRIu32 "x%" PRIu32 " tiles)\n",
	    width,
	    height,
	    tileCountX,
	    tileCountY
	);
	if (timestamp) {
		appendf(text, "// Generated on: %s\n", timestamp->c_str());
	}
	text += "\n#include <gb/gb.h>\n\n";

	text += "// Sprite/tile data\n";
	appendf(text, "const unsigned char %s_data[] = {\n", name.c_str());
	for (size_t i = 0; i < bytes.size(); ++i) {
		bool lineStart = i % VALUES_PER_LINE == 0;
		bool lineEnd = i % VALUES_PER_LINE == VALUES_PER_LINE - 1 || i == bytes.size() - 1;
		appendf(
		    text,
		    "%s0x%02" PRIX8 "%s",
		    lineStart ? "    " : " ",
		    bytes[i],
		    i == bytes.size() - 1 ? "\n" : lineEnd ? ",\n" : ","
		);
	}
	text += "};\n\n";

	text += "// Sprite/tile information:\n";
	appendf(text, "#define %s_WIDTH %" PRIu32 "\n", upperName.c_str(), width);
	appendf(text, "#define %s_HEIGHT %" PRIu32 "\n", upperName.c_str(), height);
	appendf(text, "#define %s_TILE_WIDTH %" PRIu32 "\n", upperName.c_str(), tileCountX);
	appendf(text, "#define %s_TILE_HEIGHT %" PRIu32 "\n", upperName.c_str(), tileCountY);
	appendf(text, "#define %s_TILE_COUNT %" PRIu64 "\n", upperName.c_str(), nbTiles);
	appendf(text, "#define %s_SIZE %zu\n\n", upperName.c_str(), bytes.size());

	text += "// Usage example:\n";
	appendf(text, "// set_sprite_data(0, %" PRIu64 ", %s_data);\n", nbTiles, name.c_str());
	text += "// set_sprite_tile(0, 0); // To use the first tile\n";

	return text;
}
