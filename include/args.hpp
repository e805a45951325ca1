#pragma once

#include "types.hpp"

#include <string>
#include <vector>

namespace sweep
{
	struct opts
	{
		std::string targets_path;
		std::string wordlist_path;

		// handed to the external tool after all of the built-in arguments
		std::vector<std::string> extra_args;

		std::string tool{"ffuf"};
		std::string counter{"pv"};
		std::string output_parent{"."};

		f32 poll_interval{1.0f};
		f32 cooldown{1.0f};
		bool force_heuristic{false};
	};

	// prints the usage and exits if the arguments don't make sense
	opts parse_cli_args(const int argc, char** const argv);

	// checks that the input files and the external tool exist
	// returns the exit code to stop with, or exit_code::ok
	int validate_opts(const opts& o);
}
