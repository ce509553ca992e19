// SPDX-License-Identifier: MIT

#ifndef GBCONV_LISTING_HPP
#define GBCONV_LISTING_HPP

#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

// Replaces every character that may not appear in a C identifier with an underscore
std::string sanitizeIdentifier(std::string const &name);

// The sanitized file name of `path`, without its directory or extension
std::string baseNameFromPath(std::string const &path);

// Renders tile data as a C source file for GBDK: the data as a `<baseName>_data` array, followed
// by `<BASENAME>_WIDTH`, `_HEIGHT`, `_TILE_WIDTH`, `_TILE_HEIGHT`, `_TILE_COUNT` and `_SIZE`.
// The timestamp, if any, is only printed in the header comment.
std::string renderListing(
    std::vector<uint8_t> const &bytes,
    uint32_t width,
    uint32_t height,
    uint32_t tileCountX,
    uint32_t tileCountY,
    std::string const &baseName,
    std::optional<std::string> const &timestamp = std::nullopt
);

#endif // GBCONV_LISTING_HPP
