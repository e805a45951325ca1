#include "report.hpp"
#include "job.hpp"
#include "targets.hpp"
#include "timer.hpp"

#include <format>
#include <iostream>

namespace sweep
{
	constexpr std::string_view header_rule = "==============================================";

	std::string format_header(const std::string_view text)
	{
		return std::format("\n{}\n{}\n{}\n", header_rule, text, header_rule);
	}

	std::string format_banner(const target& t, const u64 total)
	{
		return format_header(std::format("[{}/{}] Starting: {}", t.ordinal, total, t.name));
	}

	std::string format_progress(const target& t, const std::filesystem::path& wordlist, const progress_sample& sample, const std::filesystem::path& log)
	{
		return std::format(
			"\n    Subdomain : {}\n"
			"    Wordlist  : {} (total lines: {})\n"
			"    Tried     : {}\n"
			"    Remaining : {} ({}%)\n"
			"    Log file  : {}\n\n",
			t.name,
			wordlist.filename().string(), sample.total,
			sample.completed,
			sample.remaining, sample.percent_remaining,
			log.string());
	}

	std::string format_command(const std::vector<std::string>& argv)
	{
		return std::format("Running command: {}\n", shell_join(argv));
	}

	std::string format_summary(const std::filesystem::path& run_root, const u64 elapsed_millis, const u64 finished, const u64 failed)
	{
		return format_header(std::format("All done. Results: {}", run_root.string()))
			+ std::format("{} {}, {} with a non-zero exit\n", finished, finished == 1 ? "target" : "targets", failed)
			+ std::format("Total time: {}\n", format_duration(elapsed_millis))
			+ "IMPORTANT: Only scan targets you own or have explicit permission to test.\n";
	}

	void print_banner(const target& t, const u64 total)
	{
		std::cout << format_banner(t, total);
	}

	void print_progress(const target& t, const std::filesystem::path& wordlist, const progress_sample& sample, const std::filesystem::path& log)
	{
		std::cout << format_progress(t, wordlist, sample, log) << std::flush;
	}

	void print_summary(const std::filesystem::path& run_root, const u64 elapsed_millis, const u64 finished, const u64 failed)
	{
		std::cout << format_summary(run_root, elapsed_millis, finished, failed);
	}
}
