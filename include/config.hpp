#pragma once

#include "args.hpp"
#include "capability.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sweep
{
	// everything a run needs to know, built once at startup and never modified afterwards
	struct run_config
	{
		std::filesystem::path targets_path;
		std::filesystem::path wordlist_path;
		std::vector<std::string> extra_args;

		std::string tool;
		std::string counter;

		capabilities caps;
		bool force_heuristic{false};

		// YYYYMMDD_HHMMSS of the moment the run started
		std::string timestamp;
		std::filesystem::path output_root;

		std::chrono::milliseconds poll_interval{1000};
		std::chrono::milliseconds cooldown{1000};
	};

	run_config make_run_config(const opts& o, const capabilities& caps, const std::chrono::system_clock::time_point started);
}
