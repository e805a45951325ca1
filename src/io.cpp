#include "io.hpp"
#include "error.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace sweep
{
	std::optional<std::string> read_text(const std::filesystem::path& path)
	{
		std::ifstream file(path, std::ios::binary);
		if (!file.is_open())
			return std::nullopt;

		std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

		if (file.bad())
			return std::nullopt;

		return text;
	}

	u64 count_lines(const std::filesystem::path& path)
	{
		std::ifstream file(path, std::ios::binary);
		if (!file.is_open())
			throw input_error(std::format("cannot read the wordlist: {}", path.string()));

		// wordlists can get big, so count them in chunks instead of
		// reading the whole thing into memory
		std::array<char, 64 * 1024> buf;
		u64 lines{0};

		while (file)
		{
			file.read(buf.data(), buf.size());
			lines += std::count(buf.begin(), buf.begin() + file.gcount(), '\n');
		}

		if (file.bad())
			throw input_error(std::format("error while reading the wordlist: {}", path.string()));

		return lines;
	}

	u64 count_occurrences(const std::filesystem::path& path, const std::string_view needle)
	{
		const std::optional<std::string> text = read_text(path);
		if (!text || needle.empty())
			return 0;

		u64 count{0};
		size_t pos = text->find(needle);
		while (pos != std::string::npos)
		{
			++count;
			pos = text->find(needle, pos + needle.size());
		}

		return count;
	}

	std::filesystem::path make_temp_file(const std::string_view prefix)
	{
		std::string path_template = (std::filesystem::temp_directory_path() / std::format("{}XXXXXX", prefix)).string();

		const int fd = mkstemp(path_template.data());
		if (fd < 0)
			throw std::system_error(errno, std::generic_category(), "mkstemp");

		::close(fd);
		return path_template;
	}

	void clear_cli_line()
	{
		std::cout << "\033[2K\r";
	}
}
