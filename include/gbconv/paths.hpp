// SPDX-License-Identifier: MIT

#ifndef GBCONV_PATHS_HPP
#define GBCONV_PATHS_HPP

#include <string>

#include "gbconv/main.hpp"

// Replaces the extension of the file name in `path` (if it has one) with `extension`
std::string replaceExtension(std::string const &path, char const *extension);

// Fills in the output image and listing paths that were not given on the command line
void deriveOutputPaths(Options &opts);

// The image whose tiles get encoded: the input with `-E` or when the output image goes to
// standard output, otherwise the output image
std::string const &encodedImagePath(Options const &opts);

// Base name of the listing's array and constants
std::string listingIdentifier(Options const &opts);

#endif // GBCONV_PATHS_HPP
