// SPDX-License-Identifier: MIT

#ifndef GBCONV_VERSION_HPP
#define GBCONV_VERSION_HPP

// The Git revision gbconv was built from, or its release number if that is unknown
char const *get_package_version_string();

#endif // GBCONV_VERSION_HPP
