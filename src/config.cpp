#include "config.hpp"
#include "layout.hpp"

#include <algorithm>
#include <cmath>

namespace sweep
{
	static std::chrono::milliseconds seconds_to_millis(const f32 seconds)
	{
		return std::chrono::milliseconds(static_cast<i64>(std::lround(seconds * 1000.0f)));
	}

	run_config make_run_config(const opts& o, const capabilities& caps, const std::chrono::system_clock::time_point started)
	{
		run_config cfg;
		cfg.targets_path = o.targets_path;
		cfg.wordlist_path = o.wordlist_path;
		cfg.extra_args = o.extra_args;
		cfg.tool = o.tool;
		cfg.counter = o.counter;
		cfg.caps = caps;
		cfg.force_heuristic = o.force_heuristic;
		cfg.timestamp = format_timestamp(started);
		cfg.output_root = run_root_path(o.output_parent, cfg.timestamp);
		cfg.poll_interval = std::max(seconds_to_millis(o.poll_interval), std::chrono::milliseconds(1));
		cfg.cooldown = seconds_to_millis(o.cooldown);
		return cfg;
	}
}
