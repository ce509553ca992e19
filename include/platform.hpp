// SPDX-License-Identifier: MIT

#ifndef GBCONV_PLATFORM_HPP
#define GBCONV_PLATFORM_HPP

// `strcasecmp`, `isatty` and `fileno` are POSIX; MSVC names them differently
#ifdef _MSC_VER
	#include <io.h>     // IWYU pragma: export
	#include <stdio.h>  // IWYU pragma: export
	#include <string.h> // IWYU pragma: export
	#define strcasecmp _stricmp
	#define isatty     _isatty
	#define fileno     _fileno
#else
	#include <stdio.h>   // IWYU pragma: export
	#include <strings.h> // IWYU pragma: export
	#include <unistd.h>  // IWYU pragma: export
#endif

#endif // GBCONV_PLATFORM_HPP
