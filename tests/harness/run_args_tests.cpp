#include "args.hpp"
#include "config.hpp"
#include "error.hpp"

#include "harness.hpp"

#include <chrono>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace
{
	using harness::require;
	using namespace std::chrono_literals;

	sweep::opts parse(std::initializer_list<std::string_view> args)
	{
		std::vector<std::string> storage;
		storage.reserve(args.size() + 1);
		storage.emplace_back("subsweep");
		for (const std::string_view a : args)
			storage.emplace_back(a);

		std::vector<char*> argv;
		argv.reserve(storage.size());
		for (std::string& s : storage)
			argv.push_back(s.data());

		return sweep::parse_cli_args(static_cast<int>(argv.size()), argv.data());
	}

	bool test_defaults()
	{
		const sweep::opts o = parse({ "subs.txt", "words.txt" });

		bool ok = true;
		ok &= require(o.targets_path == "subs.txt" && o.wordlist_path == "words.txt", "positional arguments");
		ok &= require(o.tool == "ffuf" && o.counter == "pv", "default executables");
		ok &= require(o.output_parent == ".", "default output directory");
		ok &= require(o.poll_interval == 1.0f && o.cooldown == 1.0f, "default intervals");
		ok &= require(!o.force_heuristic, "streaming allowed by default");
		ok &= require(o.extra_args.empty(), "no passthrough arguments");
		return ok;
	}

	bool test_options_and_passthrough()
	{
		const sweep::opts o = parse({
			"-t", "/opt/ffuf/ffuf",
			"--counter", "/usr/local/bin/pv",
			"-o", "scans",
			"-i", "0.5",
			"--cooldown", "2",
			"--heuristic",
			"subs.txt", "words.txt",
			"--", "-mc", "200,301", "-t", "50", "--",
		});

		bool ok = true;
		ok &= require(o.tool == "/opt/ffuf/ffuf", "tool");
		ok &= require(o.counter == "/usr/local/bin/pv", "counter");
		ok &= require(o.output_parent == "scans", "output directory");
		ok &= require(o.poll_interval == 0.5f && o.cooldown == 2.0f, "intervals");
		ok &= require(o.force_heuristic, "forced heuristic");
		ok &= require(o.extra_args == std::vector<std::string>{ "-mc", "200,301", "-t", "50", "--" }, "passthrough arguments kept verbatim");
		return ok;
	}

	bool test_run_config()
	{
		sweep::opts o = parse({ "-o", "scans", "-i", "0.25", "-c", "0", "subs.txt", "words.txt", "--", "-v" });
		const sweep::capabilities caps{ .counter_found = true, .tool_reads_wordlist = true };
		const sweep::run_config cfg = sweep::make_run_config(o, caps, std::chrono::system_clock::now());

		bool ok = true;
		ok &= require(cfg.timestamp.size() == 15 && cfg.timestamp[8] == '_', "timestamp shape");
		ok &= require(cfg.output_root == std::filesystem::path("scans") / ("ffuf-results_" + cfg.timestamp), "output root");
		ok &= require(cfg.poll_interval == 250ms && cfg.cooldown == 0ms, "intervals");
		ok &= require(cfg.caps.streaming_available(), "capabilities carried over");
		ok &= require(cfg.extra_args == std::vector<std::string>{ "-v" }, "passthrough arguments");
		return ok;
	}

	bool test_validation()
	{
		harness::temp_dir dir;
		const auto subs = harness::write_file(dir / "subs.txt", "a.test\n");
		const auto words = harness::write_file(dir / "words.txt", "admin\n");
		const auto tool = harness::write_script(dir / "ffuf", "exit 0\n");

		sweep::opts o;
		o.targets_path = subs.string();
		o.wordlist_path = words.string();
		o.tool = tool.string();

		sweep::opts missing_targets = o;
		missing_targets.targets_path = (dir / "nope.txt").string();

		sweep::opts missing_words = o;
		missing_words.wordlist_path = dir.path().string();

		sweep::opts missing_tool = o;
		missing_tool.tool = "definitely-not-installed-fuzzer";

		bool ok = true;
		ok &= require(sweep::validate_opts(o) == sweep::exit_code::ok, "valid options");
		ok &= require(sweep::validate_opts(missing_targets) == sweep::exit_code::missing_input, "missing target list");
		ok &= require(sweep::validate_opts(missing_words) == sweep::exit_code::missing_input, "wordlist is a directory");
		ok &= require(sweep::validate_opts(missing_tool) == sweep::exit_code::missing_tool, "missing tool");
		return ok;
	}
}

int main()
{
	const harness::test_case cases[] = {
		{"defaults", test_defaults},
		{"options_and_passthrough", test_options_and_passthrough},
		{"run_config", test_run_config},
		{"validation", test_validation},
	};

	return harness::run_cases(cases);
}
