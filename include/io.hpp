#pragma once

#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sweep
{
	// the whole file as a string, nullopt if it doesn't exist or can't be read
	std::optional<std::string> read_text(const std::filesystem::path& path);

	// number of newline characters in the file
	// throws input_error if the file can't be read
	u64 count_lines(const std::filesystem::path& path);

	// non-overlapping occurrences of the needle in the file,
	// a missing or unreadable file counts as zero
	u64 count_occurrences(const std::filesystem::path& path, const std::string_view needle);

	// creates an empty file with a unique name into the temp directory
	// throws std::system_error if that fails
	std::filesystem::path make_temp_file(const std::string_view prefix);

	void clear_cli_line();
}
