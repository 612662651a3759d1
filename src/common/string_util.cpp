#include "chronorange/common/string_util.hpp"

#include <algorithm>
#include <cctype>

namespace chronorange {

// Remove leading ' ', '\f', '\n', '\r', '\t', '\v'
void StringUtil::LTrim(string &str) {
	auto it = str.begin();
	while (it != str.end() && CharacterIsSpace(*it)) {
		it++;
	}
	str.erase(str.begin(), it);
}

// Remove trailing ' ', '\f', '\n', '\r', '\t', '\v'
void StringUtil::RTrim(string &str) {
	str.erase(std::find_if(str.rbegin(), str.rend(), [](char ch) { return !CharacterIsSpace(ch); }).base(),
	          str.end());
}

void StringUtil::Trim(string &str) {
	StringUtil::LTrim(str);
	StringUtil::RTrim(str);
}

bool StringUtil::Contains(const string &haystack, const string &needle) {
	return haystack.find(needle) != string::npos;
}

string StringUtil::Join(const vector<string> &input, const string &separator) {
	string result;
	for (idx_t i = 0; i < input.size(); i++) {
		if (i > 0) {
			result += separator;
		}
		result += input[i];
	}
	return result;
}

string StringUtil::Lower(const string &str) {
	string copy(str);
	std::transform(copy.begin(), copy.end(), copy.begin(),
	               [](unsigned char c) { return StringUtil::CharacterToLower(static_cast<char>(c)); });
	return (copy);
}

string StringUtil::Upper(const string &str) {
	string copy(str);
	std::transform(copy.begin(), copy.end(), copy.begin(),
	               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
	return (copy);
}

} // namespace chronorange
