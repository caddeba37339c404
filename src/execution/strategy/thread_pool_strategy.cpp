#include "execution/strategy/thread_pool_strategy.hpp"

#include <spdlog/spdlog.h>


void ThreadPoolStrategy::ThreadTaskHandle::execute()
{
	if(!mark_running())
	{
		return;
	}

	JobContext context(
		stop_source_.get_token(),
		[this](const ProgressSnapshot& snapshot)
		{
			notify_progress(snapshot);
		}
	);

	try
	{
		auto result = job_->run(context);
		mark_completed(std::move(result));
	}
	catch(const std::exception& error)
	{
		spdlog::error("Job {} failed: {}", job_->name(), error.what());
		mark_failed(error.what());
	}
	catch(...)
	{
		spdlog::error("Job {} failed with a non-standard exception", job_->name());
		mark_failed("unknown error");
	}
}

void ThreadPoolStrategy::ThreadTaskHandle::interrupt()
{
	stop_source_.request_stop();
}

ThreadPoolStrategy::ThreadPoolStrategy(std::size_t max_workers)
	: QueuedExecutionStrategy(max_workers, "Thread pool")
{
}

std::string_view ThreadPoolStrategy::kind() const noexcept
{
	return "ThreadPool";
}

std::shared_ptr<QueuedExecutionStrategy::QueuedTaskHandle> ThreadPoolStrategy::make_handle(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks)
{
	return std::make_shared<ThreadTaskHandle>(std::move(job), std::move(callbacks));
}
