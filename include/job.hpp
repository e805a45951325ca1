#pragma once

#include "cmd.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "targets.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sweep
{
	// the wordlist is piped through the counter into the stdin of the tool,
	// the counter draws an exact progress bar as a side effect
	struct exact_streaming {};

	// the tool reads the wordlist by itself and progress is estimated from
	// the results file it writes
	struct heuristic {};

	using strategy = std::variant<exact_streaming, heuristic>;

	// picked once per run
	strategy select_strategy(const capabilities& caps, const bool force_heuristic);

	std::string_view strategy_description(const strategy& mode);

	// options every run of the tool gets before the passthrough arguments
	const std::vector<std::string>& base_tool_args();

	// each finished request shows up in the json results with a status field
	constexpr std::string_view result_record_marker = "\"status\"";

	struct progress_sample
	{
		u64 completed{0};
		u64 total{1};
		u64 remaining{0};

		// always within [0, 100]
		i32 percent_remaining{100};
	};

	// the total is floored to 1
	progress_sample make_sample(const u64 completed, const u64 total);

	// throttles the progress output to one block per distinct percentage
	struct job_state
	{
		i32 last_percent{-1};

		// true if the sample should be printed, remembers it if so
		bool should_emit(const progress_sample& sample);
	};

	enum class job_phase
	{
		pending,
		launching,
		running,
		completed
	};

	struct job
	{
		target t;
		target_paths paths;
		strategy mode;

		// lines in the wordlist, never zero
		u64 wordlist_total{1};

		std::vector<std::string> tool_argv;

		// only used with exact_streaming
		std::vector<std::string> counter_argv;

		// only used with heuristic, removed after the tool exits
		std::filesystem::path results_file;

		job_phase phase{job_phase::pending};
	};

	std::vector<std::string> build_tool_argv(const run_config& cfg, const target& t, const strategy& mode, const std::filesystem::path& results_file);
	std::vector<std::string> build_counter_argv(const run_config& cfg, const target& t, const u64 wordlist_total);

	// counts the wordlist and builds the command lines for a target
	//
	// throws input_error if the wordlist can't be read and std::system_error
	// if the temporary results file can't be created
	job make_job(const run_config& cfg, const target& t, const target_paths& paths, const strategy& mode);

	// runs the job until the tool exits
	//
	// a tool that fails or can't even be started doesn't stop anything,
	// its exit status is returned and the details end up in the log
	cmd_res run_job(job& j, const run_config& cfg);
}
