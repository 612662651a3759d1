#include "chronorange/main/config.hpp"
#include "chronorange/common/exception.hpp"
#include "chronorange/common/string_util.hpp"
#include "chronorange/main/settings.hpp"

namespace chronorange {

#define CHRONORANGE_GLOBAL(_PARAM)                                                                                     \
	{ _PARAM::Name, _PARAM::Description, _PARAM::InputType, _PARAM::SetGlobal, _PARAM::ResetGlobal, _PARAM::GetSetting }
#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, nullptr, nullptr, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {CHRONORANGE_GLOBAL(ClosedSetting),
                                                       CHRONORANGE_GLOBAL(EnableLoggingSetting),
                                                       CHRONORANGE_GLOBAL(LoggingLevelSetting),
                                                       CHRONORANGE_GLOBAL(LoggingStorageSetting),
                                                       CHRONORANGE_GLOBAL(TimeUnitSetting),
                                                       CHRONORANGE_GLOBAL(TimeZoneSetting),
                                                       FINAL_SETTING};

RangeConfig::RangeConfig() {
}

idx_t RangeConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> RangeConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t index = 0; internal_options[index].name; index++) {
		names.emplace_back(internal_options[index].name);
	}
	return names;
}

optional_ptr<const ConfigurationOption> RangeConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	for (idx_t index = 0; internal_options[index].name; index++) {
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

static const ConfigurationOption &GetOptionOrThrow(const string &name) {
	auto option = RangeConfig::GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration option \"%s\", available options: %s", name,
		                            StringUtil::Join(RangeConfig::GetOptionNames(), ", "));
	}
	return *option;
}

void RangeConfig::SetOptionByName(const string &name, const string &value) {
	SetOption(nullptr, GetOptionOrThrow(name), value);
}

void RangeConfig::SetOptionsByName(const unordered_map<string, string> &values) {
	for (auto &kv : values) {
		auto &name = kv.first;
		auto &value = kv.second;
		SetOptionByName(name, value);
	}
}

void RangeConfig::ResetOptionByName(const string &name) {
	ResetOption(nullptr, GetOptionOrThrow(name));
}

string RangeConfig::GetOptionValue(const string &name) const {
	auto &option = GetOptionOrThrow(name);
	return option.get_setting(*this);
}

void RangeConfig::SetOption(optional_ptr<RangeContext> context, const ConfigurationOption &option,
                            const string &value) {
	if (!option.set_option) {
		throw InvalidInputException("Could not set option \"%s\"", option.name);
	}
	option.set_option(context, *this, value);
}

void RangeConfig::ResetOption(optional_ptr<RangeContext> context, const ConfigurationOption &option) {
	if (!option.reset_option) {
		throw InternalException("Could not reset option \"%s\"", option.name);
	}
	option.reset_option(context, *this);
}

} // namespace chronorange
