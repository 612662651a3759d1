//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/string_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"

#include <fmt/printf.h>

namespace chronorange {

/**
 * String Utility Functions
 * Note that these are not the most efficient implementations (i.e., they copy
 * memory) and therefore they should only be used for debug messages and other
 * such things.
 */
class StringUtil {
public:
	static bool CharacterIsSpace(char c) {
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
	}
	static bool CharacterIsDigit(char c) {
		return c >= '0' && c <= '9';
	}
	static bool CharacterIsAlpha(char c) {
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
	}
	static char CharacterToLower(char c) {
		if (c >= 'A' && c <= 'Z') {
			return c - ('A' - 'a');
		}
		return c;
	}

	//! Remove leading whitespace
	static void LTrim(string &str);
	//! Remove trailing whitespace
	static void RTrim(string &str);
	//! Remove leading and trailing whitespace
	static void Trim(string &str);

	//! Returns true if the needle string exists inside the haystack
	static bool Contains(const string &haystack, const string &needle);

	//! Join multiple strings into one string. Components are concatenated by the given separator
	static string Join(const vector<string> &input, const string &separator);

	//! Convert a string to lowercase
	static string Lower(const string &str);
	//! Convert a string to uppercase
	static string Upper(const string &str);

	//! Format a string using printf semantics
	template <typename... ARGS>
	static string Format(const string &fmt_str, ARGS... params) {
		return fmt::sprintf(fmt_str, params...);
	}
};

} // namespace chronorange
