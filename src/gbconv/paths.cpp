// SPDX-License-Identifier: MIT

#include "gbconv/paths.hpp"

#include <string>

#include "gbconv/listing.hpp"
#include "gbconv/main.hpp"

std::string replaceExtension(std::string const &path, char const *extension) {
	size_t nameStart = path.find_last_of("/\\");
	nameStart = nameStart == path.npos ? 0 : nameStart + 1;

	// A leading dot (as in ".png") starts the name, not an extension
	size_t dot = path.rfind('.');
	size_t len = dot != path.npos && dot > nameStart ? dot : path.size();
	return path.substr(0, len) + extension;
}

void deriveOutputPaths(Options &opts) {
	if (!opts.encodeOnly && opts.output.empty()) {
		opts.output = replaceExtension(opts.input, "_gameboy.png");
	}
	if (opts.gbdk && opts.listing.empty()) {
		opts.listing = replaceExtension(encodedImagePath(opts), ".c");
	}
}

std::string const &encodedImagePath(Options const &opts) {
	return opts.encodeOnly || opts.output == "-" ? opts.input : opts.output;
}

std::string listingIdentifier(Options const &opts) {
	return opts.varName.empty() ? baseNameFromPath(encodedImagePath(opts))
	                            : sanitizeIdentifier(opts.varName);
}
