#include "args.hpp"
#include "cmd.hpp"
#include "error.hpp"

#include <algorithm>
#include <clipp.h>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <string_view>

namespace sweep
{
	// everything after this is passed to the external tool untouched
	constexpr std::string_view passthrough_separator = "--";

	opts parse_cli_args(const int argc, char** const argv)
	{
		opts o;
		bool print_help{false};

		// split the passthrough arguments off before clipp gets to see them,
		// since the external tool has flags that would clash with ours
		std::vector<char*> own_args(argv, argv + argc);
		const auto separator = std::find_if(own_args.begin(), own_args.end(), [](const char* arg) { return arg == passthrough_separator; });
		if (separator != own_args.end())
		{
			o.extra_args.assign(separator + 1, own_args.end());
			own_args.erase(separator, own_args.end());
		}

		auto cli = (
			clipp::value("targets").set(o.targets_path)
			% "file with one subdomain or url per line, blank lines and lines starting with # are skipped",

			clipp::value("wordlist").set(o.wordlist_path)
			% "wordlist shared by all of the targets",

			(clipp::option("-t", "--tool") & clipp::value("path").set(o.tool))
			% std::format("the fuzzer to run against each target (default: {})", o.tool),

			(clipp::option("-p", "--counter") & clipp::value("path").set(o.counter))
			% std::format("line counting utility used to stream the wordlist with exact progress (default: {})", o.counter),

			(clipp::option("-o", "--output-dir") & clipp::value("dir").set(o.output_parent))
			% std::format("directory to create the timestamped results directory into (default: {})", o.output_parent),

			(clipp::option("-i", "--poll-interval") & clipp::number("seconds").set(o.poll_interval))
			% std::format("how often progress is estimated when streaming isn't available (default: {})", o.poll_interval),

			(clipp::option("-c", "--cooldown") & clipp::number("seconds").set(o.cooldown))
			% std::format("pause between two targets (default: {})", o.cooldown),

			clipp::option("--heuristic").set(o.force_heuristic)
			% "estimate progress from the results file even if streaming would be available",

			clipp::option("-h", "--help").set(print_help) % "print this help page"
		);

		const bool parsed = static_cast<bool>(clipp::parse(static_cast<int>(own_args.size()), own_args.data(), cli));

		if (print_help)
		{
			std::cout << clipp::make_man_page(cli, "subsweep")
				<< "\nARGUMENTS AFTER -- ARE PASSED TO THE FUZZER AS-IS\n";
			std::exit(exit_code::ok);
		}

		if (!parsed || o.poll_interval <= 0 || o.cooldown < 0)
		{
			std::cerr << clipp::make_man_page(cli, "subsweep");
			std::exit(exit_code::usage);
		}

		return o;
	}

	int validate_opts(const opts& o)
	{
		std::error_code ec;

		if (!std::filesystem::is_regular_file(o.targets_path, ec))
		{
			std::cerr << "Subdomain file not found: " << o.targets_path << '\n';
			return exit_code::missing_input;
		}

		if (!std::filesystem::is_regular_file(o.wordlist_path, ec))
		{
			std::cerr << "Wordlist file not found: " << o.wordlist_path << '\n';
			return exit_code::missing_input;
		}

		if (!find_executable(o.tool))
		{
			std::cerr << o.tool << " not installed or not in PATH\n";
			return exit_code::missing_tool;
		}

		return exit_code::ok;
	}
}
