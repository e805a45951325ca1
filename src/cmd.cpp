#include "cmd.hpp"
#include "timer.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace sweep
{
	using namespace std::chrono_literals;

	// how often an exited child is checked for while waiting on it
	constexpr std::chrono::milliseconds reap_poll_time = 20ms;

	// characters that never need quoting in a shell
	constexpr std::string_view shell_safe_chars = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=.,/:@%";

	static i32 decode_wait_status(const int status)
	{
		if (WIFEXITED(status))
			return WEXITSTATUS(status);

		if (WIFSIGNALED(status))
			return 128 + WTERMSIG(status);

		return 1;
	}

	fd_handle::~fd_handle()
	{
		close();
	}

	fd_handle::fd_handle(fd_handle&& other) noexcept
	:fd(other.fd)
	{
		other.fd = -1;
	}

	fd_handle& fd_handle::operator=(fd_handle&& other) noexcept
	{
		if (this != &other)
		{
			close();
			fd = other.fd;
			other.fd = -1;
		}
		return *this;
	}

	void fd_handle::close()
	{
		if (fd >= 0)
			::close(fd);

		fd = -1;
	}

	pipe_ends make_pipe()
	{
		int fds[2] = { -1, -1 };
		if (pipe2(fds, O_CLOEXEC) != 0)
			throw std::system_error(errno, std::generic_category(), "pipe");

		return pipe_ends{ fd_handle(fds[0]), fd_handle(fds[1]) };
	}

	fd_handle open_output_file(const std::filesystem::path& path, const bool append)
	{
		const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (append ? O_APPEND : O_TRUNC);
		const int fd = ::open(path.c_str(), flags, 0644);

		if (fd < 0)
			throw std::system_error(errno, std::generic_category(), "open " + path.string());

		return fd_handle(fd);
	}

	fd_handle open_input_file(const std::filesystem::path& path)
	{
		const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

		if (fd < 0)
			throw std::system_error(errno, std::generic_category(), "open " + path.string());

		return fd_handle(fd);
	}

	process::~process()
	{
		kill_and_reap();
	}

	process::process(process&& other) noexcept
	:pid_(other.pid_), reaped(other.reaped), status(other.status)
	{
		other.pid_ = -1;
		other.reaped = true;
	}

	process& process::operator=(process&& other) noexcept
	{
		if (this != &other)
		{
			kill_and_reap();
			pid_ = other.pid_;
			reaped = other.reaped;
			status = other.status;
			other.pid_ = -1;
			other.reaped = true;
		}
		return *this;
	}

	bool process::try_reap()
	{
		if (reaped)
			return true;

		int raw_status = 0;
		const pid_t res = waitpid(pid_, &raw_status, WNOHANG);

		if (res == 0)
			return false;

		// a signal got in the way, try again on the next poll. Any other
		// error (ECHILD) means the status is gone for good
		if (res < 0 && errno == EINTR)
			return false;

		status = res < 0 ? 1 : decode_wait_status(raw_status);
		reaped = true;
		return true;
	}

	void process::kill_and_reap()
	{
		if (reaped)
			return;

		::kill(pid_, SIGKILL);
		wait();
	}

	bool process::running()
	{
		return !try_reap();
	}

	bool process::wait_for(const std::chrono::milliseconds timeout)
	{
		const auto deadline = std::chrono::steady_clock::now() + timeout;

		while (!try_reap())
		{
			const auto now = std::chrono::steady_clock::now();
			if (now >= deadline)
				return false;

			std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(reap_poll_time, deadline - now));
		}

		return true;
	}

	i32 process::wait()
	{
		while (!reaped)
		{
			int raw_status = 0;
			const pid_t res = waitpid(pid_, &raw_status, 0);

			if (res < 0 && errno == EINTR)
				continue;

			status = res < 0 ? 1 : decode_wait_status(raw_status);
			reaped = true;
		}

		return status;
	}

	void process::signal(const int sig)
	{
		if (!reaped)
			::kill(pid_, sig);
	}

	process spawn(const std::vector<std::string>& argv, const stdio_redirect& io)
	{
		if (argv.empty())
			throw std::system_error(std::make_error_code(std::errc::invalid_argument), "spawn");

		std::vector<char*> cargs;
		cargs.reserve(argv.size() + 1);
		for (const std::string& arg : argv)
			cargs.push_back(const_cast<char*>(arg.c_str()));
		cargs.push_back(nullptr);

		posix_spawn_file_actions_t actions;
		posix_spawn_file_actions_init(&actions);

		if (io.in >= 0)
			posix_spawn_file_actions_adddup2(&actions, io.in, STDIN_FILENO);

		if (io.out >= 0)
			posix_spawn_file_actions_adddup2(&actions, io.out, STDOUT_FILENO);

		if (io.err >= 0)
			posix_spawn_file_actions_adddup2(&actions, io.err, STDERR_FILENO);

		// the child starts with the default dispositions for the signals
		// we catch ourselves so that an interrupt can actually stop it
		posix_spawnattr_t attr;
		posix_spawnattr_init(&attr);

		sigset_t default_signals;
		sigemptyset(&default_signals);
		sigaddset(&default_signals, SIGINT);
		sigaddset(&default_signals, SIGTERM);
		sigaddset(&default_signals, SIGPIPE);
		posix_spawnattr_setsigdefault(&attr, &default_signals);

		sigset_t empty_mask;
		sigemptyset(&empty_mask);
		posix_spawnattr_setsigmask(&attr, &empty_mask);
		posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

		pid_t pid = -1;
		const int res = posix_spawnp(&pid, cargs[0], &actions, &attr, cargs.data(), environ);

		posix_spawnattr_destroy(&attr);
		posix_spawn_file_actions_destroy(&actions);

		if (res != 0)
			throw std::system_error(res, std::generic_category(), "failed to launch " + argv[0]);

		return process(pid);
	}

	cmd_res run_cmd(const std::vector<std::string>& argv, std::string& output)
	{
		timer t;
		cmd_res res;
		output.clear();

		try
		{
			pipe_ends out_pipe = make_pipe();
			process proc = spawn(argv, { .in = -1, .out = out_pipe.write.get(), .err = out_pipe.write.get() });

			// get rid of our copy of the write end, otherwise reading would never hit EOF
			out_pipe.write.close();

			char buf[4096];
			while (true)
			{
				const ssize_t n = ::read(out_pipe.read.get(), buf, sizeof(buf));

				if (n < 0 && errno == EINTR)
					continue;

				if (n <= 0)
					break;

				output.append(buf, static_cast<size_t>(n));
			}

			res.return_value = proc.wait();
		}
		catch (const std::system_error&)
		{
			res.return_value = 127;
		}

		res.exec_time = t.elapsed_millis();
		return res;
	}

	static bool is_executable_file(const std::filesystem::path& path)
	{
		std::error_code ec;
		return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
	}

	std::optional<std::filesystem::path> find_executable(const std::string_view name)
	{
		if (name.empty())
			return std::nullopt;

		// paths with a slash are not looked up from PATH
		if (name.find('/') != std::string_view::npos)
		{
			if (is_executable_file(name))
				return std::filesystem::path(name);

			return std::nullopt;
		}

		const char* path_env = std::getenv("PATH");
		const std::string_view search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

		size_t begin = 0;
		while (begin <= search_path.size())
		{
			size_t end = search_path.find(':', begin);
			if (end == std::string_view::npos)
				end = search_path.size();

			// an empty PATH entry means the current directory
			const std::string_view dir = search_path.substr(begin, end - begin);
			const std::filesystem::path candidate = std::filesystem::path(dir.empty() ? "." : dir) / name;

			if (is_executable_file(candidate))
				return candidate;

			begin = end + 1;
		}

		return std::nullopt;
	}

	std::string shell_quote(const std::string_view arg)
	{
		if (!arg.empty() && arg.find_first_not_of(shell_safe_chars) == std::string_view::npos)
			return std::string(arg);

		std::string quoted = "'";
		for (const char c : arg)
		{
			if (c == '\'')
				quoted += "'\\''";
			else
				quoted += c;
		}
		quoted += '\'';

		return quoted;
	}

	std::string shell_join(const std::vector<std::string>& argv)
	{
		std::string joined;
		for (const std::string& arg : argv)
		{
			if (!joined.empty())
				joined += ' ';

			joined += shell_quote(arg);
		}
		return joined;
	}
}
