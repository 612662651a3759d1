//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/common/exception.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/string_util.hpp"

#include <stdexcept>

namespace chronorange {

//===--------------------------------------------------------------------===//
// Exception Types
//===--------------------------------------------------------------------===//

enum class ExceptionType : uint8_t {
	INVALID = 0,          // invalid type
	OUT_OF_RANGE = 1,     // value out of range error
	CONVERSION = 2,       // conversion/casting error
	INVALID_INPUT = 3,    // invalid input
	TIME_ZONE = 4,        // time zone could not be resolved
	INTERNAL = 5          // internal error
};

class Exception : public std::runtime_error {
public:
	Exception(ExceptionType exception_type, const string &message);

	ExceptionType type;
	string raw_message;

public:
	const string &RawMessage() const {
		return raw_message;
	}

	static string ExceptionTypeToString(ExceptionType type);
	static ExceptionType StringToExceptionType(const string &type);

	template <typename... ARGS>
	static string ConstructMessage(const string &msg, ARGS... params) {
		return StringUtil::Format(msg, params...);
	}
};

//===--------------------------------------------------------------------===//
// Exception derived classes
//===--------------------------------------------------------------------===//

class OutOfRangeException : public Exception {
public:
	explicit OutOfRangeException(const string &msg);

	template <typename... ARGS>
	explicit OutOfRangeException(const string &msg, ARGS... params)
	    : OutOfRangeException(ConstructMessage(msg, params...)) {
	}
};

class ConversionException : public Exception {
public:
	explicit ConversionException(const string &msg);

	template <typename... ARGS>
	explicit ConversionException(const string &msg, ARGS... params)
	    : ConversionException(ConstructMessage(msg, params...)) {
	}
};

class InvalidInputException : public Exception {
public:
	explicit InvalidInputException(const string &msg);

	template <typename... ARGS>
	explicit InvalidInputException(const string &msg, ARGS... params)
	    : InvalidInputException(ConstructMessage(msg, params...)) {
	}
};

//! Raised when a time zone id is unknown, or a local time is ambiguous or does not exist in that zone
class TimeZoneException : public Exception {
public:
	explicit TimeZoneException(const string &msg);

	template <typename... ARGS>
	explicit TimeZoneException(const string &msg, ARGS... params)
	    : TimeZoneException(ConstructMessage(msg, params...)) {
	}
};

class InternalException : public Exception {
public:
	explicit InternalException(const string &msg);

	template <typename... ARGS>
	explicit InternalException(const string &msg, ARGS... params)
	    : InternalException(ConstructMessage(msg, params...)) {
	}
};

} // namespace chronorange
