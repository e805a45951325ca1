#pragma once

#include <stdexcept>
#include <string>

namespace sweep
{
	// the target list or the wordlist could not be read
	//
	// this is the only kind of error that stops the whole run
	struct input_error : std::runtime_error
	{
		explicit input_error(const std::string& what) : std::runtime_error(what) {}
	};

	enum exit_code
	{
		ok = 0,
		usage = 2,
		missing_input = 3,
		missing_tool = 4,
	};
}
