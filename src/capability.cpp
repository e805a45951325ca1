#include "capability.hpp"
#include "cmd.hpp"

namespace sweep
{
	// the help text check is only a rough guess of the tool being able to
	// read its wordlist from a pipe, but good enough in practice
	constexpr char wordlist_flag[] = "-w";

	capabilities detect(const std::string& tool, const std::string& counter)
	{
		capabilities caps;
		caps.counter_found = find_executable(counter).has_value();

		std::string help_text;
		run_cmd({ tool, "-h" }, help_text);
		caps.tool_reads_wordlist = help_text.find(wordlist_flag) != std::string::npos;

		return caps;
	}
}
