#include "targets.hpp"
#include "error.hpp"
#include "layout.hpp"

#include <format>

namespace sweep
{
	static bool is_space(const char c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f';
	}

	std::string normalize(const std::string_view raw)
	{
		std::string text;
		text.reserve(raw.size());

		for (const char c : raw)
			if (c != '\r')
				text += c;

		size_t begin = 0;
		while (begin < text.size() && is_space(text[begin]))
			++begin;

		// whitespace and slashes are stripped from the end together so that
		// something like "host/ " doesn't need two passes
		size_t end = text.size();
		while (end > begin && (is_space(text[end - 1]) || text[end - 1] == '/'))
			--end;

		return text.substr(begin, end - begin);
	}

	bool is_skipped(const std::string_view normalized)
	{
		return normalized.empty() || normalized.front() == '#';
	}

	std::string make_url_template(const std::string_view normalized)
	{
		if (normalized.starts_with("http://") || normalized.starts_with("https://"))
			return std::format("{}/{}", normalized, fuzz_marker);

		return std::format("https://{}/{}", normalized, fuzz_marker);
	}

	target_reader::target_reader(const std::filesystem::path& path)
	:file(path)
	{
		if (!file.is_open())
			throw input_error(std::format("cannot read the target list: {}", path.string()));
	}

	std::optional<target> target_reader::next()
	{
		std::string line;
		while (std::getline(file, line))
		{
			std::string name = normalize(line);
			if (is_skipped(name))
				continue;

			target t;
			t.raw = std::move(line);
			t.ordinal = ++ordinal;
			t.safe_name = safe_name(name);
			t.url_template = make_url_template(name);
			t.name = std::move(name);
			return t;
		}

		return std::nullopt;
	}

	u64 count_targets(const std::filesystem::path& path)
	{
		target_reader reader(path);

		u64 count{0};
		while (reader.next())
			++count;

		return count;
	}
}
