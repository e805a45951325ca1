#pragma once

#include "types.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

namespace sweep
{
	// placeholder the external tool substitutes each wordlist entry into
	constexpr char fuzz_marker[] = "FUZZ";

	struct target
	{
		// the line as it was in the target list
		std::string raw;

		// 1-based position among the targets that weren't skipped
		u64 ordinal{0};

		// raw with carriage returns, surrounding whitespace and trailing slashes removed
		std::string name;

		std::string safe_name;
		std::string url_template;
	};

	// strips carriage returns, leading whitespace and any trailing mix of
	// whitespace and slashes
	std::string normalize(const std::string_view raw);

	// blank lines and comments don't produce a target
	bool is_skipped(const std::string_view normalized);

	// scheme defaults to https, the fuzz marker gets appended as the last path segment
	std::string make_url_template(const std::string_view normalized);

	// reads targets one at a time from a target list
	//
	// the reader can only be walked through once
	class target_reader
	{
	public:
		// throws input_error if the file can't be opened
		explicit target_reader(const std::filesystem::path& path);

		std::optional<target> next();

	private:
		std::ifstream file;
		u64 ordinal{0};
	};

	// the amount of targets a target_reader on the same file would produce
	u64 count_targets(const std::filesystem::path& path);
}
