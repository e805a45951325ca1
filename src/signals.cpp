#include "signals.hpp"

#include <csignal>

namespace sweep
{
	static volatile std::sig_atomic_t received_signal{0};

	static void on_interrupt(const int sig)
	{
		received_signal = sig;
	}

	void install_interrupt_handlers()
	{
		struct sigaction action{};
		action.sa_handler = on_interrupt;
		sigemptyset(&action.sa_mask);
		action.sa_flags = 0;

		sigaction(SIGINT, &action, nullptr);
		sigaction(SIGTERM, &action, nullptr);
	}

	bool interrupted() noexcept
	{
		return received_signal != 0;
	}

	int interrupt_signal() noexcept
	{
		return received_signal;
	}

	void clear_interrupt() noexcept
	{
		received_signal = 0;
	}
}
