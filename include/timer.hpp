#pragma once

#include <chrono>
#include <string>

#include "types.hpp"

namespace sweep
{
	// wall clock stopwatch used for job and run durations
	class timer
	{
	public:
		timer();

		void restart();
		u64 elapsed_millis() const;

	private:
		std::chrono::time_point<std::chrono::steady_clock> start_time;
	};

	// formats a duration in milliseconds as "1h 2m 3s", "2m 3s" or "3.4s"
	std::string format_duration(const u64 millis);
}
