//===----------------------------------------------------------------------===//
//                         chronorange
//
// chronorange/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "chronorange/common/constants.hpp"
#include "chronorange/common/enums/closed_window.hpp"
#include "chronorange/common/enums/time_unit.hpp"
#include "chronorange/common/optional_ptr.hpp"
#include "chronorange/logging/logging.hpp"

namespace chronorange {

class RangeConfig;
class RangeContext;

typedef void (*set_option_function_t)(optional_ptr<RangeContext> context, RangeConfig &config, const string &input);
typedef void (*reset_option_function_t)(optional_ptr<RangeContext> context, RangeConfig &config);
typedef string (*get_option_function_t)(const RangeConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	const char *parameter_type;
	set_option_function_t set_option;
	reset_option_function_t reset_option;
	get_option_function_t get_setting;
};

struct RangeConfigOptions {
	//! Unit of the epoch integers produced by date ranges
	TimeUnit time_unit = TimeUnit::MICROSECONDS;
	//! Which bounds are included in ranges
	ClosedWindow closed = ClosedWindow::BOTH;
	//! Time zone that calendar steps are resolved in (empty: naive calendar)
	string time_zone;
	//! Logging configuration
	LogConfig log_config;
};

class RangeConfig {
public:
	RangeConfig();

	RangeConfigOptions options;

public:
	static idx_t GetOptionCount();
	static vector<string> GetOptionNames();
	//! Lookup an option by (case insensitive) name, returns nullptr if there is no such option
	static optional_ptr<const ConfigurationOption> GetOptionByName(const string &name);

	//! Set an option by name. Throws an InvalidInputException for unknown options or invalid values
	void SetOptionByName(const string &name, const string &value);
	void SetOptionsByName(const unordered_map<string, string> &values);
	void ResetOptionByName(const string &name);
	string GetOptionValue(const string &name) const;

	//! Apply an option, forwarding side effects (e.g. logging settings) to the context if there is one
	void SetOption(optional_ptr<RangeContext> context, const ConfigurationOption &option, const string &value);
	void ResetOption(optional_ptr<RangeContext> context, const ConfigurationOption &option);
};

} // namespace chronorange
