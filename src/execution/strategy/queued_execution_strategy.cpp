#include "execution/strategy/queued_execution_strategy.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>


QueuedExecutionStrategy::QueuedExecutionStrategy(std::size_t max_workers, std::string pool_name)
	: pool_name_(std::move(pool_name)), max_workers_(max_workers)
{
	if(max_workers_ == 0)
	{
		throw std::invalid_argument(pool_name_ + " requires at least one worker");
	}

	workers_.reserve(max_workers_);
	for(std::size_t i = 0; i < max_workers_; ++i)
	{
		workers_.emplace_back([this]()
		{
			thread_body(*this);
		});
	}

	spdlog::info("{} started with {} workers", pool_name_, max_workers_);
}

QueuedExecutionStrategy::~QueuedExecutionStrategy()
{
	shutdown(true);
}

void QueuedExecutionStrategy::thread_body(QueuedExecutionStrategy& pool)
{
	while(true)
	{
		std::shared_ptr<QueuedTaskHandle> handle;
		{
			std::unique_lock lock(pool.queue_mutex_);

			pool.queue_cv_.wait(
				lock,
				[&queue=pool.queue_, &shutting_down=pool.shutting_down_]
				{
					return !queue.empty() || shutting_down;
				}
			);

			if(pool.queue_.empty())
			{
				return;
			}

			handle = std::move(pool.queue_.front());
			pool.queue_.pop_front();
		}

		++pool.active_workers_;
		handle->execute();
		--pool.active_workers_;
	}
}

std::shared_ptr<IExecutionStrategy::TaskHandle> QueuedExecutionStrategy::schedule(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks)
{
	auto handle = make_handle(std::move(job), std::move(callbacks));

	{
		std::unique_lock lock(queue_mutex_);
		if(shutting_down_)
		{
			throw StrategyShutDownException(pool_name_ + " is shut down");
		}

		queue_.emplace_back(handle);
	}
	queue_cv_.notify_one();

	spdlog::debug("Job {} queued on {}", handle->job().name(), pool_name_);

	return handle;
}

std::size_t QueuedExecutionStrategy::max_workers() const noexcept
{
	return max_workers_;
}

std::size_t QueuedExecutionStrategy::active_workers() const noexcept
{
	return active_workers_.load();
}

void QueuedExecutionStrategy::shutdown(bool wait)
{
	std::deque<std::shared_ptr<QueuedTaskHandle>> abandoned;
	{
		std::unique_lock lock(queue_mutex_);
		shutting_down_ = true;
		abandoned.swap(queue_);
	}
	queue_cv_.notify_all();

	for(const auto& handle: abandoned)
	{
		handle->cancel();
	}

	if(!abandoned.empty())
	{
		spdlog::info("{} dropped {} queued jobs", pool_name_, abandoned.size());
	}

	if(wait)
	{
		for(auto& worker: workers_)
		{
			if(worker.joinable())
			{
				worker.join();
			}
		}
	}
}
