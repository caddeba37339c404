#include "utils/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <spdlog/spdlog.h>

#include "utils/line_buffer.hpp"


extern char** environ;

namespace
{
	constexpr int POLL_INTERVAL_MS = 100;

	class SpawnFileActions
	{
	public:
		SpawnFileActions()
		{
			if(const int error = ::posix_spawn_file_actions_init(&actions_); error != 0)
			{
				throw ProcessError(std::string("Failed to prepare process spawn: ") + std::strerror(error));
			}
		}

		~SpawnFileActions()
		{
			::posix_spawn_file_actions_destroy(&actions_);
		}

		SpawnFileActions(const SpawnFileActions&) = delete;
		SpawnFileActions& operator=(const SpawnFileActions&) = delete;

		void redirect_output(int output_fd)
		{
			check(::posix_spawn_file_actions_addopen(&actions_, STDIN_FILENO, "/dev/null", O_RDONLY, 0));
			check(::posix_spawn_file_actions_adddup2(&actions_, output_fd, STDOUT_FILENO));
			check(::posix_spawn_file_actions_adddup2(&actions_, output_fd, STDERR_FILENO));
		}

		[[nodiscard]] const posix_spawn_file_actions_t* get() const noexcept
		{
			return &actions_;
		}

	private:
		posix_spawn_file_actions_t actions_{};

		static void check(int error)
		{
			if(error != 0)
			{
				throw ProcessError(std::string("Failed to prepare process spawn: ") + std::strerror(error));
			}
		}
	};

	/// Children start with an empty signal mask and default SIGTERM handling, whatever
	/// the calling thread blocks.
	class SpawnAttributes
	{
	public:
		SpawnAttributes()
		{
			if(const int error = ::posix_spawnattr_init(&attributes_); error != 0)
			{
				throw ProcessError(std::string("Failed to prepare process spawn: ") + std::strerror(error));
			}

			sigset_t signals;
			::sigemptyset(&signals);
			const int mask_error = ::posix_spawnattr_setsigmask(&attributes_, &signals);

			::sigaddset(&signals, SIGTERM);
			const int default_error = ::posix_spawnattr_setsigdefault(&attributes_, &signals);

			const int flags_error = ::posix_spawnattr_setflags(&attributes_, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

			for(const int error: {mask_error, default_error, flags_error})
			{
				if(error != 0)
				{
					::posix_spawnattr_destroy(&attributes_);
					throw ProcessError(std::string("Failed to prepare process spawn: ") + std::strerror(error));
				}
			}
		}

		~SpawnAttributes()
		{
			::posix_spawnattr_destroy(&attributes_);
		}

		SpawnAttributes(const SpawnAttributes&) = delete;
		SpawnAttributes& operator=(const SpawnAttributes&) = delete;

		[[nodiscard]] const posix_spawnattr_t* get() const noexcept
		{
			return &attributes_;
		}

	private:
		posix_spawnattr_t attributes_{};
	};

	int wait_for_exit(pid_t pid)
	{
		int wait_status = 0;
		while(::waitpid(pid, &wait_status, 0) < 0)
		{
			if(errno != EINTR)
			{
				throw ProcessError("Waiting for process " + std::to_string(pid) + " failed: " + std::strerror(errno));
			}
		}

		return wait_status;
	}
}

int run_process(const std::vector<std::string>& argv, const OutputLineCallback& on_line, std::stop_token stop_token)
{
	if(argv.empty())
	{
		throw ProcessError("Empty command line");
	}

	if(stop_token.stop_requested())
	{
		throw ProcessCancelledError(argv.front() + " cancelled before start");
	}

	std::vector<char*> c_argv;
	c_argv.reserve(argv.size() + 1);
	for(const auto& argument: argv)
	{
		c_argv.push_back(const_cast<char*>(argument.c_str()));
	}
	c_argv.push_back(nullptr);

	std::array<int, 2> pipe_fds{};
	if(::pipe2(pipe_fds.data(), O_CLOEXEC) != 0)
	{
		throw ProcessError(std::string("Failed to create output pipe: ") + std::strerror(errno));
	}

	pid_t pid = 0;
	int spawn_error = 0;
	try
	{
		SpawnFileActions file_actions;
		file_actions.redirect_output(pipe_fds[1]);
		const SpawnAttributes attributes;
		spawn_error = ::posix_spawnp(&pid, c_argv.front(), file_actions.get(), attributes.get(), c_argv.data(), environ);
	}
	catch(const ProcessError&)
	{
		::close(pipe_fds[0]);
		::close(pipe_fds[1]);
		throw;
	}
	::close(pipe_fds[1]);

	if(spawn_error != 0)
	{
		::close(pipe_fds[0]);
		throw ProcessError("Failed to start " + argv.front() + ": " + std::strerror(spawn_error));
	}

	spdlog::debug("Started {} as process {}", argv.front(), pid);

	LineBuffer line_buffer("\n\r");
	std::array<char, 4096> chunk{};
	bool terminated = false;

	pollfd poll_fd{pipe_fds[0], POLLIN, 0};
	while(true)
	{
		if(!terminated && stop_token.stop_requested())
		{
			spdlog::info("Stopping {} (process {})", argv.front(), pid);
			::kill(pid, SIGTERM);
			terminated = true;
		}

		const int ready = ::poll(&poll_fd, 1, POLL_INTERVAL_MS);
		if(ready < 0)
		{
			if(errno == EINTR)
			{
				continue;
			}
			spdlog::error("Polling output of process {} failed: {}", pid, std::strerror(errno));
			break;
		}
		if(ready == 0)
		{
			continue;
		}

		const auto count = ::read(pipe_fds[0], chunk.data(), chunk.size());
		if(count < 0)
		{
			if(errno == EINTR || errno == EAGAIN)
			{
				continue;
			}
			spdlog::error("Reading output of process {} failed: {}", pid, std::strerror(errno));
			break;
		}
		if(count == 0)
		{
			break;
		}

		try
		{
			line_buffer.append(std::string_view(chunk.data(), static_cast<std::size_t>(count)), on_line);
		}
		catch(const std::exception& error)
		{
			spdlog::error("Output handler of {} failed: {}", argv.front(), error.what());
			::kill(pid, SIGTERM);
			::close(pipe_fds[0]);
			wait_for_exit(pid);
			throw;
		}
	}
	::close(pipe_fds[0]);

	const int wait_status = wait_for_exit(pid);
	line_buffer.flush(on_line);

	if(terminated)
	{
		throw ProcessCancelledError(argv.front() + " was cancelled");
	}

	if(WIFSIGNALED(wait_status))
	{
		throw ProcessError(argv.front() + " terminated by signal " + std::to_string(WTERMSIG(wait_status)));
	}

	const int exit_code = WEXITSTATUS(wait_status);
	spdlog::debug("Process {} ({}) exited with code {}", pid, argv.front(), exit_code);

	return exit_code;
}
