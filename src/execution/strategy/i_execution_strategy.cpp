#include "execution/strategy/i_execution_strategy.hpp"

#include <spdlog/spdlog.h>


IExecutionStrategy::TaskHandle::TaskHandle(std::shared_ptr<Job> job, Callbacks callbacks)
	: job_(std::move(job)), callbacks_(std::move(callbacks))
{
}

IExecutionStrategy::TaskHandle::Status IExecutionStrategy::TaskHandle::status() const noexcept
{
	std::unique_lock lock(state_mutex_);
	return status_;
}

bool IExecutionStrategy::TaskHandle::is_done() const noexcept
{
	using enum Status;
	const auto current = status();
	return current == COMPLETED || current == FAILED || current == CANCELLED;
}

bool IExecutionStrategy::TaskHandle::cancel_requested() const noexcept
{
	return cancel_requested_.load();
}

std::optional<JobResult> IExecutionStrategy::TaskHandle::result() const
{
	std::unique_lock lock(state_mutex_);
	return result_;
}

std::optional<std::string> IExecutionStrategy::TaskHandle::error() const
{
	std::unique_lock lock(state_mutex_);
	return error_;
}

const Job& IExecutionStrategy::TaskHandle::job() const noexcept
{
	return *job_;
}

void IExecutionStrategy::TaskHandle::wait() const
{
	std::unique_lock lock(state_mutex_);
	state_cv_.wait(
		lock,
		[this]
		{
			return status_ != Status::PENDING && status_ != Status::RUNNING;
		}
	);
}

IExecutionStrategy::TaskHandle::CancelOutcome IExecutionStrategy::TaskHandle::cancel()
{
	bool cancelled_before_start = false;
	{
		std::unique_lock lock(state_mutex_);

		switch(status_)
		{
			case Status::PENDING:
			{
				cancel_requested_ = true;
				status_ = Status::CANCELLED;
				cancelled_before_start = true;
				break;
			}
			case Status::RUNNING:
			{
				cancel_requested_ = true;
				break;
			}
			default:
				return CancelOutcome::ALREADY_FINISHED;
		}
	}

	if(cancelled_before_start)
	{
		notify_finished();
		return CancelOutcome::CANCELLED_BEFORE_START;
	}

	spdlog::debug("Requesting stop of running job {}", job_->name());
	interrupt();
	return CancelOutcome::STOP_REQUESTED;
}

bool IExecutionStrategy::TaskHandle::mark_running()
{
	{
		std::unique_lock lock(state_mutex_);
		if(status_ != Status::PENDING)
		{
			return false;
		}
		status_ = Status::RUNNING;
	}

	if(callbacks_.on_started)
	{
		try
		{
			callbacks_.on_started();
		}
		catch(const std::exception& error)
		{
			spdlog::error("Start observer of job {} failed: {}", job_->name(), error.what());
		}
	}

	return true;
}

void IExecutionStrategy::TaskHandle::mark_completed(JobResult result)
{
	finish(Status::COMPLETED, std::move(result), std::nullopt);
}

void IExecutionStrategy::TaskHandle::mark_failed(std::string error)
{
	finish(Status::FAILED, std::nullopt, std::move(error));
}

void IExecutionStrategy::TaskHandle::notify_progress(const ProgressSnapshot& snapshot) const
{
	if(!callbacks_.on_progress)
	{
		return;
	}

	try
	{
		callbacks_.on_progress(snapshot);
	}
	catch(const std::exception& error)
	{
		spdlog::error("Progress observer of job {} failed: {}", job_->name(), error.what());
	}
}

void IExecutionStrategy::TaskHandle::finish(Status status, std::optional<JobResult> result, std::optional<std::string> error)
{
	{
		std::unique_lock lock(state_mutex_);
		if(status_ != Status::PENDING && status_ != Status::RUNNING)
		{
			return;
		}

		if(cancel_requested_ && status != Status::CANCELLED)
		{
			spdlog::debug("Job {} returned after cancellation, its outcome is dropped", job_->name());
			status = Status::CANCELLED;
			result.reset();
			error.reset();
		}

		status_ = status;
		result_ = std::move(result);
		error_ = std::move(error);
	}

	notify_finished();
}

void IExecutionStrategy::TaskHandle::notify_finished()
{
	state_cv_.notify_all();

	if(callbacks_.on_completed)
	{
		try
		{
			callbacks_.on_completed(*this);
		}
		catch(const std::exception& callback_error)
		{
			spdlog::error("Completion observer of job {} failed: {}", job_->name(), callback_error.what());
		}
	}
}
