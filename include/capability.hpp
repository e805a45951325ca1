#pragma once

#include <string>

namespace sweep
{
	struct capabilities
	{
		// the line counting utility was found from PATH
		bool counter_found{false};

		// the help text of the external tool mentions a wordlist flag
		bool tool_reads_wordlist{false};

		bool streaming_available() const noexcept { return counter_found && tool_reads_wordlist; }
	};

	// checks whether the wordlist can be streamed through the counter into the tool
	//
	// never fails, anything missing just means that streaming isn't available
	capabilities detect(const std::string& tool, const std::string& counter);
}
