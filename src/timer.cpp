#include "timer.hpp"

#include <format>

namespace sweep
{
	timer::timer()
	{
		restart();
	}

	void timer::restart()
	{
		start_time = std::chrono::steady_clock::now();
	}

	u64 timer::elapsed_millis() const
	{
		const auto duration = std::chrono::steady_clock::now() - start_time;
		return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
	}

	std::string format_duration(const u64 millis)
	{
		const u64 total_seconds = millis / 1000;
		const u64 hours = total_seconds / 3600;
		const u64 minutes = (total_seconds % 3600) / 60;
		const u64 seconds = total_seconds % 60;

		if (hours != 0)
			return std::format("{}h {}m {}s", hours, minutes, seconds);

		if (minutes != 0)
			return std::format("{}m {}s", minutes, seconds);

		return std::format("{:.1f}s", millis / 1000.0);
	}
}
