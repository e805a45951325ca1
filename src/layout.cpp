#include "layout.hpp"
#include "targets.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace sweep
{
	static bool is_safe_char(const char c)
	{
		return (c >= 'A' && c <= 'Z')
			|| (c >= 'a' && c <= 'z')
			|| (c >= '0' && c <= '9')
			|| c == '.' || c == '_' || c == '-';
	}

	std::string safe_name(const std::string_view raw)
	{
		std::string name(raw);
		for (char& c : name)
			if (!is_safe_char(c))
				c = '_';

		return name;
	}

	std::string format_timestamp(const std::chrono::system_clock::time_point time)
	{
		const std::time_t t = std::chrono::system_clock::to_time_t(time);
		std::tm local{};
		localtime_r(&t, &local);

		std::ostringstream ss;
		ss << std::put_time(&local, "%Y%m%d_%H%M%S");
		return ss.str();
	}

	std::filesystem::path run_root_path(const std::filesystem::path& parent, const std::string_view timestamp)
	{
		return parent / (run_root_prefix + std::string(timestamp));
	}

	void make_run_root(const std::filesystem::path& run_root)
	{
		std::filesystem::create_directories(run_root);
	}

	target_paths layout(const std::filesystem::path& run_root, const target& t)
	{
		target_paths paths;
		paths.dir = run_root / t.safe_name;
		paths.log = paths.dir / (t.safe_name + ".log");

		std::filesystem::create_directories(paths.dir);
		return paths;
	}
}
