#include "capability.hpp"
#include "cmd.hpp"
#include "io.hpp"

#include "harness.hpp"

#include <chrono>
#include <csignal>
#include <string>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace
{
	using harness::require;
	using namespace std::chrono_literals;

	bool test_exit_status_is_reported()
	{
		sweep::process ok_proc = sweep::spawn({ "/bin/sh", "-c", "exit 0" });
		sweep::process failing = sweep::spawn({ "/bin/sh", "-c", "exit 7" });
		sweep::process killed = sweep::spawn({ "/bin/sh", "-c", "kill -9 $$" });

		bool ok = true;
		ok &= require(ok_proc.wait() == 0, "zero exit");
		ok &= require(failing.wait() == 7, "non-zero exit");
		ok &= require(killed.wait() == 128 + 9, "killed by a signal");
		return ok;
	}

	bool test_spawn_failure_throws()
	{
		try
		{
			sweep::spawn({ "/nonexistent/definitely-not-a-tool" });
		}
		catch (const std::system_error&)
		{
			return true;
		}

		return require(false, "expected std::system_error");
	}

	bool test_wait_for_times_out()
	{
		sweep::process proc = sweep::spawn({ "/bin/sh", "-c", "sleep 5" });

		bool ok = true;
		ok &= require(!proc.wait_for(50ms), "still running after the timeout");
		ok &= require(proc.running(), "reported as running");

		proc.signal(SIGTERM);
		ok &= require(proc.wait_for(5s), "exits after being signaled");
		ok &= require(proc.return_value() == 128 + SIGTERM, "terminated by the signal");
		return ok;
	}

	bool test_child_collected_elsewhere()
	{
		sweep::process proc = sweep::spawn({ "/bin/sh", "-c", "exit 5" });

		// someone else reaps it first, the exit status is gone with it
		int raw = 0;
		const pid_t collected = waitpid(proc.pid(), &raw, 0);

		bool ok = true;
		ok &= require(collected == proc.pid(), "reaped outside of the handle");
		ok &= require(proc.wait_for(1s), "handle doesn't keep waiting for it");
		ok &= require(!proc.running(), "no longer running");
		ok &= require(proc.return_value() == 1, "unknown status reported as a failure");
		return ok;
	}

	bool test_open_input_file()
	{
		harness::temp_dir dir;
		const auto input = harness::write_file(dir / "input.txt", "abc");

		sweep::fd_handle fd = sweep::open_input_file(input);
		char buf[8] = {};
		const ssize_t n = read(fd.get(), buf, sizeof(buf));

		bool threw = false;
		try
		{
			sweep::open_input_file(dir / "missing.txt");
		}
		catch (const std::system_error&)
		{
			threw = true;
		}

		const sweep::fd_handle null_in = sweep::open_input_file("/dev/null");
		sweep::process reader = sweep::spawn({ "/bin/sh", "-c", "read l && exit 1; exit 0" }, { .in = null_in.get() });

		bool ok = true;
		ok &= require(fd.valid() && n == 3 && std::string(buf, 3) == "abc", "file contents readable");
		ok &= require(threw, "missing file throws");
		ok &= require(reader.wait() == 0, "child reads end of input from /dev/null");
		return ok;
	}

	bool test_pipe_between_processes()
	{
		harness::temp_dir dir;
		const auto out_path = dir / "out.txt";

		sweep::fd_handle out = sweep::open_output_file(out_path, false);
		sweep::pipe_ends p = sweep::make_pipe();

		sweep::process producer = sweep::spawn({ "/bin/sh", "-c", "printf 'a\\nb\\nc\\n'" }, { .in = -1, .out = p.write.get(), .err = -1 });
		p.write.close();

		sweep::process consumer = sweep::spawn({ "/bin/sh", "-c", "wc -l | tr -d ' '" }, { .in = p.read.get(), .out = out.get(), .err = out.get() });
		p.read.close();

		bool ok = true;
		ok &= require(consumer.wait() == 0, "consumer exit");
		ok &= require(producer.wait() == 0, "producer exit");
		ok &= require(harness::read_file(out_path) == "3\n", "every line made it through the pipe");
		return ok;
	}

	bool test_run_cmd_merges_output()
	{
		std::string output;
		const sweep::cmd_res res = sweep::run_cmd({ "/bin/sh", "-c", "echo out; echo err >&2; exit 3" }, output);

		std::string missing_output = "stale";
		const sweep::cmd_res missing = sweep::run_cmd({ "/nonexistent/tool" }, missing_output);

		bool ok = true;
		ok &= require(res.return_value == 3, "exit status");
		ok &= require(output.find("out") != std::string::npos && output.find("err") != std::string::npos, "stdout and stderr captured");
		ok &= require(missing.return_value == 127 && missing_output.empty(), "command that can't start");
		return ok;
	}

	bool test_find_executable()
	{
		harness::temp_dir dir;
		const auto script = harness::write_script(dir / "tool", "exit 0\n");
		const auto plain = harness::write_file(dir / "plain", "not executable");

		bool ok = true;
		ok &= require(sweep::find_executable("sh").has_value(), "sh is on PATH");
		ok &= require(!sweep::find_executable("definitely-not-a-real-tool-name").has_value(), "unknown name");
		ok &= require(sweep::find_executable(script.string()) == script, "explicit path");
		ok &= require(!sweep::find_executable(plain.string()).has_value(), "file without the exec bit");
		ok &= require(!sweep::find_executable("").has_value(), "empty name");
		return ok;
	}

	bool test_shell_quote()
	{
		bool ok = true;
		ok &= require(sweep::shell_quote("-recursion-depth") == "-recursion-depth", "plain argument");
		ok &= require(sweep::shell_quote("https://x.test/FUZZ") == "https://x.test/FUZZ", "url");
		ok &= require(sweep::shell_quote("User-Agent: Mozilla/5.0") == "'User-Agent: Mozilla/5.0'", "space");
		ok &= require(sweep::shell_quote("it's") == "'it'\\''s'", "single quote");
		ok &= require(sweep::shell_quote("") == "''", "empty");
		ok &= require(sweep::shell_join({ "pv", "-l", "a b" }) == "pv -l 'a b'", "join");
		return ok;
	}

	bool test_counting_helpers()
	{
		harness::temp_dir dir;
		const auto words = harness::write_file(dir / "words.txt", "admin\nlogin\n\nbackup\n");
		const auto results = harness::write_file(dir / "results.json",
			R"({"results":[{"input":{"FUZZ":"admin"},"status":200},{"input":{"FUZZ":"login"},"status":200},{"input":{"FUZZ":"x"},"status":)");

		bool ok = true;
		ok &= require(sweep::count_lines(words) == 4, "wordlist lines");
		ok &= require(sweep::count_occurrences(results, "\"status\"") == 3, "records in a partially written file");
		ok &= require(sweep::count_occurrences(dir / "missing.json", "\"status\"") == 0, "missing results file counts as zero");

		const std::filesystem::path tmp = sweep::make_temp_file("subsweep-test-");
		ok &= require(std::filesystem::is_regular_file(tmp) && std::filesystem::file_size(tmp) == 0, "empty temp file");
		std::filesystem::remove(tmp);
		return ok;
	}

	bool test_capability_detection()
	{
		harness::temp_dir dir;
		const auto counter = harness::write_script(dir / "counter", "exit 0\n");
		const auto good_tool = harness::write_script(dir / "good-tool", "echo '  -w   Wordlist file path and keyword'\nexit 0\n");
		const auto bad_tool = harness::write_script(dir / "bad-tool", "echo 'usage: bad-tool [url]' >&2\nexit 2\n");

		const sweep::capabilities both = sweep::detect(good_tool.string(), counter.string());
		const sweep::capabilities no_flag = sweep::detect(bad_tool.string(), counter.string());
		const sweep::capabilities no_counter = sweep::detect(good_tool.string(), (dir / "missing-counter").string());
		const sweep::capabilities nothing = sweep::detect((dir / "missing-tool").string(), (dir / "missing-counter").string());

		bool ok = true;
		ok &= require(both.streaming_available(), "both present");
		ok &= require(no_flag.counter_found && !no_flag.tool_reads_wordlist && !no_flag.streaming_available(), "help without -w");
		ok &= require(!no_counter.counter_found && !no_counter.streaming_available(), "counter missing");
		ok &= require(!nothing.streaming_available(), "nothing present");
		return ok;
	}
}

int main()
{
	const harness::test_case cases[] = {
		{"exit_status_is_reported", test_exit_status_is_reported},
		{"spawn_failure_throws", test_spawn_failure_throws},
		{"wait_for_times_out", test_wait_for_times_out},
		{"child_collected_elsewhere", test_child_collected_elsewhere},
		{"open_input_file", test_open_input_file},
		{"pipe_between_processes", test_pipe_between_processes},
		{"run_cmd_merges_output", test_run_cmd_merges_output},
		{"find_executable", test_find_executable},
		{"shell_quote", test_shell_quote},
		{"counting_helpers", test_counting_helpers},
		{"capability_detection", test_capability_detection},
	};

	return harness::run_cases(cases);
}
