#include "job.hpp"
#include "io.hpp"
#include "report.hpp"
#include "signals.hpp"
#include "timer.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <format>
#include <iostream>
#include <system_error>
#include <unistd.h>

namespace sweep
{
	using namespace std::chrono_literals;

	// how quickly an interrupt gets noticed while streaming
	constexpr std::chrono::milliseconds interrupt_poll_time = 100ms;

	// how long an interrupted child gets to shut down before it gets killed
	constexpr std::chrono::milliseconds interrupt_grace_time = 5s;

	constexpr char results_file_prefix[] = "subsweep-results-";

	strategy select_strategy(const capabilities& caps, const bool force_heuristic)
	{
		if (caps.streaming_available() && !force_heuristic)
			return exact_streaming{};

		return heuristic{};
	}

	std::string_view strategy_description(const strategy& mode)
	{
		if (std::holds_alternative<exact_streaming>(mode))
			return "streaming mode (exact per-wordlist progress)";

		return "heuristic progress (approximate)";
	}

	const std::vector<std::string>& base_tool_args()
	{
		static const std::vector<std::string> args = {
			"-recursion",
			"-recursion-depth", "3",
			"-ic",
			"-v",
			"-mc", "200",
			"-H", "User-Agent: Mozilla/5.0",
		};
		return args;
	}

	progress_sample make_sample(const u64 completed, const u64 total)
	{
		progress_sample sample;
		sample.completed = completed;
		sample.total = std::max<u64>(total, 1);
		sample.remaining = completed < sample.total ? sample.total - completed : 0;

		// recursion can produce more results than there are wordlist lines
		const u64 percent_done = std::min<u64>(completed * 100 / sample.total, 100);
		sample.percent_remaining = 100 - static_cast<i32>(percent_done);

		return sample;
	}

	bool job_state::should_emit(const progress_sample& sample)
	{
		if (sample.percent_remaining == last_percent)
			return false;

		last_percent = sample.percent_remaining;
		return true;
	}

	std::vector<std::string> build_tool_argv(const run_config& cfg, const target& t, const strategy& mode, const std::filesystem::path& results_file)
	{
		std::vector<std::string> argv = { cfg.tool, "-u", t.url_template };

		if (std::holds_alternative<exact_streaming>(mode))
		{
			argv.insert(argv.end(), { "-w", std::format("-:{}", fuzz_marker) });
		}
		else
		{
			argv.insert(argv.end(), {
				"-w", std::format("{}:{}", cfg.wordlist_path.string(), fuzz_marker),
				"-o", results_file.string(),
				"-of", "json"
			});
		}

		const std::vector<std::string>& base = base_tool_args();
		argv.insert(argv.end(), base.begin(), base.end());

		// last so that they can override the defaults
		argv.insert(argv.end(), cfg.extra_args.begin(), cfg.extra_args.end());

		return argv;
	}

	std::vector<std::string> build_counter_argv(const run_config& cfg, const target& t, const u64 wordlist_total)
	{
		return {
			cfg.counter,
			"-l",
			"-s", std::to_string(wordlist_total),
			"-N", t.safe_name,
			cfg.wordlist_path.string()
		};
	}

	job make_job(const run_config& cfg, const target& t, const target_paths& paths, const strategy& mode)
	{
		job j{ .t = t, .paths = paths, .mode = mode };
		j.wordlist_total = std::max<u64>(count_lines(cfg.wordlist_path), 1);

		if (std::holds_alternative<heuristic>(mode))
			j.results_file = make_temp_file(results_file_prefix);
		else
			j.counter_argv = build_counter_argv(cfg, t, j.wordlist_total);

		j.tool_argv = build_tool_argv(cfg, t, mode, j.results_file);

		return j;
	}

	static void write_all(const int fd, const std::string_view text)
	{
		size_t written = 0;
		while (written < text.size())
		{
			const ssize_t n = ::write(fd, text.data() + written, text.size() - written);

			if (n < 0 && errno == EINTR)
				continue;

			if (n <= 0)
				throw std::system_error(errno, std::generic_category(), "write");

			written += static_cast<size_t>(n);
		}
	}

	static void stop_interrupted(process& proc)
	{
		proc.signal(interrupt_signal());

		if (!proc.wait_for(interrupt_grace_time))
			proc.signal(SIGKILL);

		proc.wait();
	}

	// waits for the process to exit, running on_tick every time the tick
	// interval passes without it having exited. Interrupts are checked in
	// short slices no matter how long the tick is
	template<typename F>
	static void supervise(process& proc, const std::chrono::milliseconds tick, F&& on_tick)
	{
		const std::chrono::milliseconds slice = std::min(tick, interrupt_poll_time);
		timer since_tick;

		while (!proc.wait_for(slice))
		{
			if (interrupted())
			{
				stop_interrupted(proc);
				return;
			}

			if (since_tick.elapsed_millis() < static_cast<u64>(tick.count()))
				continue;

			on_tick();
			since_tick.restart();
		}
	}

	static i32 run_exact(job& j, const fd_handle& null_in, const fd_handle& log)
	{
		pipe_ends words = make_pipe();

		// the counter keeps its stderr so that the progress bar shows up on the terminal
		process counter = spawn(j.counter_argv, { .in = null_in.get(), .out = words.write.get(), .err = -1 });
		words.write.close();

		process tool = spawn(j.tool_argv, { .in = words.read.get(), .out = log.get(), .err = log.get() });
		words.read.close();

		j.phase = job_phase::running;
		supervise(tool, interrupt_poll_time, [] {});

		// the counter either ran out of input already or dies to SIGPIPE now that
		// the reading end is gone
		if (interrupted())
			stop_interrupted(counter);

		counter.wait();
		return tool.return_value();
	}

	static i32 run_heuristic(job& j, const run_config& cfg, const fd_handle& null_in, const fd_handle& log)
	{
		write_all(log.get(), std::format("Running: {} -u {} -w {}\n", cfg.tool, j.t.url_template, cfg.wordlist_path.string()));

		process tool = spawn(j.tool_argv, { .in = null_in.get(), .out = log.get(), .err = log.get() });
		j.phase = job_phase::running;

		// the results file is still being written to while it's read, so the
		// completed count can lag behind a bit at any given moment
		job_state state;
		supervise(tool, cfg.poll_interval, [&]
		{
			const u64 completed = count_occurrences(j.results_file, result_record_marker);
			const progress_sample sample = make_sample(completed, j.wordlist_total);

			if (state.should_emit(sample))
				print_progress(j.t, cfg.wordlist_path, sample, j.paths.log);
		});

		return tool.return_value();
	}

	// the temporary results file goes away however the job ends
	struct results_file_cleanup
	{
		const std::filesystem::path& path;

		~results_file_cleanup()
		{
			if (path.empty())
				return;

			std::error_code ec;
			std::filesystem::remove(path, ec);
		}
	};

	cmd_res run_job(job& j, const run_config& cfg)
	{
		timer t;
		cmd_res res;

		std::cout << "Using wordlist: " << cfg.wordlist_path.string() << " (lines: " << j.wordlist_total << ")\n"
			<< "Using " << strategy_description(j.mode) << '\n'
			<< format_command(j.tool_argv);

		if (std::holds_alternative<exact_streaming>(j.mode))
			std::cout << shell_join(j.counter_argv) << " | " << shell_join(j.tool_argv) << '\n';

		std::cout << std::flush;

		const results_file_cleanup cleanup{ j.results_file };

		j.phase = job_phase::launching;
		fd_handle log = open_output_file(j.paths.log, false);

		// ffuf pauses into an interactive prompt on ENTER, keep the terminal away from it
		const fd_handle null_in = open_input_file("/dev/null");

		try
		{
			res.return_value = std::holds_alternative<exact_streaming>(j.mode)
				? run_exact(j, null_in, log)
				: run_heuristic(j, cfg, null_in, log);
		}
		catch (const std::system_error& e)
		{
			// the tool never ran, leave a note where its output would have been
			write_all(log.get(), std::format("{}\n", e.what()));
			res.return_value = 127;
		}

		j.phase = job_phase::completed;
		res.exec_time = t.elapsed_millis();

		std::cout << "\nFinished: " << j.t.name << " -- log: " << j.paths.log.string()
			<< " (" << format_duration(res.exec_time) << ")\n" << std::flush;

		return res;
	}
}
