// SPDX-License-Identifier: MIT

#ifndef GBCONV_EITHER_HPP
#define GBCONV_EITHER_HPP

#include <utility>
#include <variant>

#include "helpers.hpp" // assume

// The outcome of an operation: a result of type `T1`, or a failure of type `T2`.
// Unlike a bare `std::variant`, it converts implicitly from either, so functions can `return` both.
template<typename T1, typename T2>
class Either {
	std::variant<T1, T2> _value;

public:
	Either(T1 const &value) : _value(std::in_place_index<0>, value) {}
	Either(T1 &&value) : _value(std::in_place_index<0>, std::move(value)) {}
	Either(T2 const &value) : _value(std::in_place_index<1>, value) {}
	Either(T2 &&value) : _value(std::in_place_index<1>, std::move(value)) {}

	template<typename T>
	bool holds() const {
		return std::holds_alternative<T>(_value);
	}

	template<typename T>
	T &get() {
		assume(holds<T>());
		return std::get<T>(_value);
	}
	template<typename T>
	T const &get() const {
		assume(holds<T>());
		return std::get<T>(_value);
	}
};

#endif // GBCONV_EITHER_HPP
