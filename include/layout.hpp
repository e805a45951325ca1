#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace sweep
{
	struct target;

	constexpr char run_root_prefix[] = "ffuf-results_";

	struct target_paths
	{
		std::filesystem::path dir;
		std::filesystem::path log;
	};

	// replaces every byte that isn't [A-Za-z0-9._-] with an underscore
	std::string safe_name(const std::string_view raw);

	// local time as YYYYMMDD_HHMMSS
	std::string format_timestamp(const std::chrono::system_clock::time_point time);

	std::filesystem::path run_root_path(const std::filesystem::path& parent, const std::string_view timestamp);

	// creates the directory all of the results of a run go into
	// throws std::filesystem::filesystem_error if that fails
	void make_run_root(const std::filesystem::path& run_root);

	// creates the directory for the target if needed and returns the path
	// of the log file inside of it
	target_paths layout(const std::filesystem::path& run_root, const target& t);
}
