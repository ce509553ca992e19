// SPDX-License-Identifier: MIT

#include "version.hpp"

// The build system defines these with `-D`
#ifndef PACKAGE_VERSION
	#define PACKAGE_VERSION "1.0.0"
#endif
#ifndef BUILD_VERSION_STRING
	#define BUILD_VERSION_STRING ""
#endif

char const *get_package_version_string() {
	static char const buildVersion[] = BUILD_VERSION_STRING;
	return buildVersion[0] != '\0' ? buildVersion : "v" PACKAGE_VERSION;
}
