#pragma once

#include "types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sweep
{
	struct progress_sample;
	struct target;

	// a line of text framed with horizontal rules
	std::string format_header(const std::string_view text);

	// "[ordinal/total] Starting: target"
	std::string format_banner(const target& t, const u64 total);

	std::string format_progress(const target& t, const std::filesystem::path& wordlist, const progress_sample& sample, const std::filesystem::path& log);

	std::string format_command(const std::vector<std::string>& argv);

	// final banner of a run, with how many targets ran and how many of them
	// had the tool exit with a non-zero status
	std::string format_summary(const std::filesystem::path& run_root, const u64 elapsed_millis, const u64 finished, const u64 failed);

	void print_banner(const target& t, const u64 total);
	void print_progress(const target& t, const std::filesystem::path& wordlist, const progress_sample& sample, const std::filesystem::path& log);
	void print_summary(const std::filesystem::path& run_root, const u64 elapsed_millis, const u64 finished, const u64 failed);
}
