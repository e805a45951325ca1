#pragma once

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace sweep
{
	struct cmd_res
	{
		// exit status of the process, 128 + signal number if it was killed
		// by a signal and 127 if it couldn't be started at all
		i32 return_value{0};

		// execution time in milliseconds
		u64 exec_time{0};
	};

	// owning wrapper around a raw file descriptor
	class fd_handle
	{
	public:
		fd_handle() = default;
		explicit fd_handle(const int fd) : fd(fd) {}
		~fd_handle();

		fd_handle(const fd_handle&) = delete;
		fd_handle& operator=(const fd_handle&) = delete;
		fd_handle(fd_handle&& other) noexcept;
		fd_handle& operator=(fd_handle&& other) noexcept;

		int get() const noexcept { return fd; }
		bool valid() const noexcept { return fd >= 0; }
		void close();

	private:
		int fd{-1};
	};

	struct pipe_ends
	{
		fd_handle read;
		fd_handle write;
	};

	// both ends are close-on-exec, the child only sees the end it gets dup2'd onto
	pipe_ends make_pipe();

	// opens (and creates if needed) a file for writing the output of a process into
	fd_handle open_output_file(const std::filesystem::path& path, const bool append);

	// opens an existing file for reading, e.g. /dev/null for a child that
	// shouldn't see our stdin
	fd_handle open_input_file(const std::filesystem::path& path);

	// where the standard streams of a spawned process should point to,
	// a negative value means that the stream is inherited from us
	struct stdio_redirect
	{
		int in{-1};
		int out{-1};
		int err{-1};
	};

	// a spawned child process
	//
	// the child gets reaped at the latest when the handle goes out of scope,
	// a child that is still running at that point gets killed first
	class process
	{
	public:
		process() = default;
		explicit process(const pid_t pid) : pid_(pid), reaped(false) {}
		~process();

		process(const process&) = delete;
		process& operator=(const process&) = delete;
		process(process&& other) noexcept;
		process& operator=(process&& other) noexcept;

		pid_t pid() const noexcept { return pid_; }
		bool running();

		// blocks until the process exits or the timeout runs out,
		// returns true if the process has exited
		bool wait_for(const std::chrono::milliseconds timeout);

		// blocks until the process exits and returns its exit status
		i32 wait();

		// delivers a signal to the process if it is still running
		void signal(const int sig);

		i32 return_value() const noexcept { return status; }

	private:
		bool try_reap();
		void kill_and_reap();

		pid_t pid_{-1};
		bool reaped{true};
		i32 status{0};
	};

	// spawns the argv with the given stdio redirections
	// argv[0] is looked up from PATH if it doesn't contain a slash
	//
	// throws std::system_error if the process cannot be started
	process spawn(const std::vector<std::string>& argv, const stdio_redirect& io = {});

	// runs the argv to completion with stdout and stderr merged into the output string
	// a command that cannot be started returns 127 with an empty output
	cmd_res run_cmd(const std::vector<std::string>& argv, std::string& output);

	// looks up an executable the same way a shell would
	std::optional<std::filesystem::path> find_executable(const std::string_view name);

	// quotes an argument so that it could be pasted into a POSIX shell as-is
	std::string shell_quote(const std::string_view arg);
	std::string shell_join(const std::vector<std::string>& argv);
}
