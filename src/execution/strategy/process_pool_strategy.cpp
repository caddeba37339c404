#include "execution/strategy/process_pool_strategy.hpp"

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "execution/strategy/process/message.hpp"
#include "utils/line_buffer.hpp"


namespace
{
	template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
	template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

	bool write_all(int fd, std::string_view data)
	{
		while(!data.empty())
		{
			const auto written = ::write(fd, data.data(), data.size());
			if(written < 0)
			{
				if(errno == EINTR)
				{
					continue;
				}
				return false;
			}
			data.remove_prefix(static_cast<std::size_t>(written));
		}

		return true;
	}

	void send_message(int fd, const process::ProcessMessage& message)
	{
		if(!write_all(fd, process::encode_message(message)))
		{
			throw std::runtime_error(std::string("Failed to write to dispatcher pipe: ") + std::strerror(errno));
		}
	}

	/// Forked while other threads may hold the sink locks of the inherited logger, so the
	/// worker logs through a fresh one. The inherited logger is kept alive and never used.
	std::shared_ptr<spdlog::logger> replace_inherited_logger()
	{
		auto inherited_logger = spdlog::default_logger();

		auto worker_logger = std::make_shared<spdlog::logger>("", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
		worker_logger->set_level(inherited_logger->level());
		spdlog::set_default_logger(std::move(worker_logger));

		return inherited_logger;
	}

	sigset_t termination_signals()
	{
		sigset_t signals;
		::sigemptyset(&signals);
		::sigaddset(&signals, SIGTERM);
		return signals;
	}

	/// Turns SIGTERM into a stop request. Jobs that do not return within the grace
	/// period are killed along with the rest of the worker's process group.
	void watch_termination(std::stop_source stop_source)
	{
		const auto signals = termination_signals();
		int signal_number = 0;
		while(::sigwait(&signals, &signal_number) != 0)
		{
		}

		spdlog::debug("Worker process {} received stop request", ::getpid());
		stop_source.request_stop();

		std::this_thread::sleep_for(ProcessPoolStrategy::TERMINATION_GRACE);

		spdlog::warn("Job ignored stop request, killing worker process {}", ::getpid());
		::kill(0, SIGKILL);
	}

	[[noreturn]] void run_worker_process(Job& job, int message_fd)
	{
		if(message_fd > 3)
		{
			::close_range(3, static_cast<unsigned int>(message_fd - 1), 0);
		}
		::close_range(static_cast<unsigned int>(message_fd + 1), ~0U, 0);

		::setpgid(0, 0);
		std::signal(SIGTERM, SIG_DFL);

		const auto inherited_logger = replace_inherited_logger();

		const auto signals = termination_signals();
		::pthread_sigmask(SIG_BLOCK, &signals, nullptr);

		std::stop_source stop_source;
		std::thread(watch_termination, stop_source).detach();

		JobContext context(
			stop_source.get_token(),
			[message_fd](const ProgressSnapshot& snapshot)
			{
				send_message(message_fd, process::message::Progress{snapshot});
			}
		);

		int exit_code = 0;
		try
		{
			auto result = job.run(context);
			send_message(message_fd, process::message::Result{std::move(result)});
		}
		catch(const std::exception& error)
		{
			exit_code = 1;
			if(!write_all(message_fd, process::encode_message(process::message::Failure{error.what()})))
			{
				exit_code = 2;
			}
		}
		catch(...)
		{
			exit_code = 1;
			if(!write_all(message_fd, process::encode_message(process::message::Failure{"unknown error"})))
			{
				exit_code = 2;
			}
		}

		spdlog::default_logger_raw()->flush();
		::_exit(exit_code);
	}

	std::string describe_exit(int wait_status)
	{
		if(WIFSIGNALED(wait_status))
		{
			return "Worker process terminated by signal " + std::to_string(WTERMSIG(wait_status));
		}

		return "Worker process exited with code " + std::to_string(WEXITSTATUS(wait_status)) + " without reporting a result";
	}
}

void ProcessPoolStrategy::ProcessTaskHandle::execute()
{
	if(!mark_running())
	{
		return;
	}

	std::array<int, 2> pipe_fds{};
	if(::pipe2(pipe_fds.data(), O_CLOEXEC) != 0)
	{
		mark_failed(std::string("Failed to create worker pipe: ") + std::strerror(errno));
		return;
	}

	const pid_t pid = ::fork();
	if(pid < 0)
	{
		const std::string reason = std::strerror(errno);
		::close(pipe_fds[0]);
		::close(pipe_fds[1]);
		mark_failed("Failed to fork worker process: " + reason);
		return;
	}

	if(pid == 0)
	{
		::close(pipe_fds[0]);
		run_worker_process(*job_, pipe_fds[1]);
	}

	::close(pipe_fds[1]);
	::setpgid(pid, pid);
	attach_process(pid);
	spdlog::debug("Job {} running in worker process {}", job_->name(), pid);

	std::optional<JobResult> result;
	std::optional<std::string> failure;

	const auto dispatch_line = [this, &result, &failure](std::string_view line)
	{
		try
		{
			auto decoded = process::decode_message(line);
			std::visit(
				overloaded{
					[this](process::message::Progress& progress) { notify_progress(progress.snapshot); },
					[&result](process::message::Result& job_result) { result = std::move(job_result.value); },
					[&failure](process::message::Failure& job_failure) { failure = std::move(job_failure.error); }
				},
				decoded
			);
		}
		catch(const std::exception& error)
		{
			spdlog::warn("Ignoring output of worker process: {}", error.what());
		}
	};

	LineBuffer line_buffer;
	std::array<char, 4096> chunk{};
	while(true)
	{
		const auto count = ::read(pipe_fds[0], chunk.data(), chunk.size());
		if(count < 0)
		{
			if(errno == EINTR)
			{
				continue;
			}
			spdlog::error("Reading from worker process {} failed: {}", pid, std::strerror(errno));
			break;
		}
		if(count == 0)
		{
			break;
		}

		line_buffer.append(std::string_view(chunk.data(), static_cast<std::size_t>(count)), dispatch_line);
	}
	line_buffer.flush(dispatch_line);
	::close(pipe_fds[0]);

	detach_process();

	int wait_status = 0;
	while(::waitpid(pid, &wait_status, 0) < 0)
	{
		if(errno != EINTR)
		{
			spdlog::error("Waiting for worker process {} failed: {}", pid, std::strerror(errno));
			break;
		}
	}

	if(result.has_value())
	{
		mark_completed(std::move(result.value()));
	}
	else if(failure.has_value())
	{
		mark_failed(std::move(failure.value()));
	}
	else
	{
		mark_failed(describe_exit(wait_status));
	}
}

void ProcessPoolStrategy::ProcessTaskHandle::interrupt()
{
	std::unique_lock lock(process_mutex_);
	if(pid_ > 0)
	{
		spdlog::info("Terminating worker process {}", pid_);
		::kill(pid_, SIGTERM);
	}
}

void ProcessPoolStrategy::ProcessTaskHandle::attach_process(pid_t pid)
{
	std::unique_lock lock(process_mutex_);
	pid_ = pid;

	if(cancel_requested())
	{
		::kill(pid_, SIGTERM);
	}
}

void ProcessPoolStrategy::ProcessTaskHandle::detach_process()
{
	std::unique_lock lock(process_mutex_);
	pid_ = 0;
}

ProcessPoolStrategy::ProcessPoolStrategy(std::size_t max_workers)
	: QueuedExecutionStrategy(max_workers, "Process pool")
{
}

std::string_view ProcessPoolStrategy::kind() const noexcept
{
	return "ProcessPool";
}

std::shared_ptr<QueuedExecutionStrategy::QueuedTaskHandle> ProcessPoolStrategy::make_handle(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks)
{
	return std::make_shared<ProcessTaskHandle>(std::move(job), std::move(callbacks));
}
