#pragma once

namespace sweep
{
	// catches SIGINT and SIGTERM so that the run loop can pass them on to
	// the running job and stop instead of leaving the children behind
	void install_interrupt_handlers();

	bool interrupted() noexcept;

	// the signal that interrupted the run, 0 if there wasn't one
	int interrupt_signal() noexcept;

	// forget a previously received interrupt
	void clear_interrupt() noexcept;
}
