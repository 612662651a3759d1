#include "chronorange/common/enums/closed_window.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"

namespace chronorange {

string ClosedWindowToString(ClosedWindow closed) {
	switch (closed) {
	case ClosedWindow::BOTH:
		return "both";
	case ClosedWindow::LEFT:
		return "left";
	case ClosedWindow::RIGHT:
		return "right";
	case ClosedWindow::NONE:
		return "none";
	default:
		throw InternalException("Unrecognized closed window %d", int(closed));
	}
}

bool TryGetClosedWindow(const string &name_p, ClosedWindow &result) {
	auto name = StringUtil::Lower(name_p);
	if (name == "both") {
		result = ClosedWindow::BOTH;
	} else if (name == "left") {
		result = ClosedWindow::LEFT;
	} else if (name == "right") {
		result = ClosedWindow::RIGHT;
	} else if (name == "none") {
		result = ClosedWindow::NONE;
	} else {
		return false;
	}
	return true;
}

ClosedWindow ClosedWindowFromString(const string &name) {
	ClosedWindow result;
	if (!TryGetClosedWindow(name, result)) {
		throw InvalidInputException("closed window \"%s\" not recognized, expected one of both, left, right, none",
		                            name);
	}
	return result;
}

bool ClosedWindowIncludesStart(ClosedWindow closed) {
	switch (closed) {
	case ClosedWindow::BOTH:
	case ClosedWindow::LEFT:
		return true;
	case ClosedWindow::RIGHT:
	case ClosedWindow::NONE:
		return false;
	default:
		throw InternalException("Unrecognized closed window %d", int(closed));
	}
}

bool ClosedWindowIncludesEnd(ClosedWindow closed) {
	switch (closed) {
	case ClosedWindow::BOTH:
	case ClosedWindow::RIGHT:
		return true;
	case ClosedWindow::LEFT:
	case ClosedWindow::NONE:
		return false;
	default:
		throw InternalException("Unrecognized closed window %d", int(closed));
	}
}

} // namespace chronorange
