#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "args.hpp"
#include "capability.hpp"
#include "config.hpp"
#include "error.hpp"
#include "runner.hpp"
#include "signals.hpp"

int main(int argc, char** argv)
{
	// parsing CLI args is done in a separate compilation unit because
	// clipp has horrendous compile times
	const sweep::opts opts = sweep::parse_cli_args(argc, argv);

	if (const int res = sweep::validate_opts(opts); res != sweep::exit_code::ok)
		return res;

	const sweep::capabilities caps = sweep::detect(opts.tool, opts.counter);
	const sweep::run_config cfg = sweep::make_run_config(opts, caps, std::chrono::system_clock::now());

	sweep::install_interrupt_handlers();

	try
	{
		sweep::run_state state;
		return sweep::run_targets(cfg, state);
	}
	catch (const sweep::input_error& e)
	{
		std::cerr << e.what() << '\n';
		return sweep::exit_code::missing_input;
	}
	catch (const std::filesystem::filesystem_error& e)
	{
		std::cerr << "cannot create the results directory: " << e.what() << '\n';
		return 1;
	}
}
