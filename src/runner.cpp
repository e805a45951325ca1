#include "runner.hpp"
#include "io.hpp"
#include "job.hpp"
#include "layout.hpp"
#include "report.hpp"
#include "signals.hpp"
#include "targets.hpp"
#include "timer.hpp"

#include <iostream>
#include <system_error>
#include <thread>

namespace sweep
{
	int run_targets(const run_config& cfg, run_state& state)
	{
		timer run_timer;

		state.total_targets = count_targets(cfg.targets_path);

		make_run_root(cfg.output_root);
		const strategy mode = select_strategy(cfg.caps, cfg.force_heuristic);

		target_reader reader(cfg.targets_path);

		while (std::optional<target> t = reader.next())
		{
			print_banner(*t, state.total_targets);

			// two targets can end up with the same safe name, they will
			// share the directory and the log of the latter wins
			if (!state.used_names.insert(t->safe_name).second)
				std::cerr << "warning: " << t->name << " shares the directory " << t->safe_name << " with an earlier target\n";

			try
			{
				const target_paths paths = layout(cfg.output_root, *t);
				job j = make_job(cfg, *t, paths, mode);

				if (run_job(j, cfg).return_value != 0)
					++state.failed_targets;
			}
			catch (const std::system_error& e)
			{
				std::cerr << "could not run " << t->name << ": " << e.what() << '\n';
				++state.failed_targets;
			}

			++state.finished_targets;

			if (interrupted())
			{
				clear_cli_line();
				std::cerr << "interrupted, stopping after " << t->name << '\n';
				return 128 + interrupt_signal();
			}

			std::this_thread::sleep_for(cfg.cooldown);

			if (interrupted())
				return 128 + interrupt_signal();
		}

		print_summary(cfg.output_root, run_timer.elapsed_millis(), state.finished_targets, state.failed_targets);
		return 0;
	}
}
