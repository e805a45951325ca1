#pragma once

#include "config.hpp"
#include "types.hpp"

#include <string>
#include <unordered_set>

namespace sweep
{
	// bookkeeping shared by every job of a run
	struct run_state
	{
		u64 total_targets{0};
		u64 finished_targets{0};
		u64 failed_targets{0};

		// safe names that already have a directory in this run
		std::unordered_set<std::string> used_names;
	};

	// runs the tool against every target in the list, one at a time
	//
	// returns the exit code for the whole program, throws input_error if
	// the target list or the wordlist can't be read
	int run_targets(const run_config& cfg, run_state& state);
}
