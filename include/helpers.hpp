// SPDX-License-Identifier: MIT

#ifndef GBCONV_HELPERS_HPP
#define GBCONV_HELPERS_HPP

#include <assert.h>

// An invariant of the program: checked by debug builds, and trusted by release builds
#ifdef NDEBUG
	#define assume(x) \
		do { \
			if (!(x)) \
				__builtin_unreachable(); \
		} while (0)
#else
	#define assume(x) assert(x)
#endif

// Calls `func` when going out of scope, to release what a C library allocated
template<typename F>
class Defer {
	F _func;

public:
	explicit Defer(F func) : _func(func) {}
	Defer(Defer const &) = delete;
	~Defer() { _func(); }
};

#endif // GBCONV_HELPERS_HPP
