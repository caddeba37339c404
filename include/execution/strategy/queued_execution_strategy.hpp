#ifndef MEDIAFORGE_QUEUED_EXECUTION_STRATEGY_HPP
#define MEDIAFORGE_QUEUED_EXECUTION_STRATEGY_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "execution/strategy/i_execution_strategy.hpp"


/// Fixed set of dispatcher threads draining one FIFO queue. Subclasses only decide
/// how a dequeued task is executed.
class QueuedExecutionStrategy: public IExecutionStrategy
{
public:
	class QueuedTaskHandle: public TaskHandle
	{
	public:
		using TaskHandle::TaskHandle;

	private:
		friend class QueuedExecutionStrategy;

		virtual void execute() = 0;
	};

	~QueuedExecutionStrategy() override;

	std::shared_ptr<TaskHandle> schedule(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks) final;

	[[nodiscard]] std::size_t max_workers() const noexcept final;
	[[nodiscard]] std::size_t active_workers() const noexcept final;

	void shutdown(bool wait) final;

protected:
	QueuedExecutionStrategy(std::size_t max_workers, std::string pool_name);

	virtual std::shared_ptr<QueuedTaskHandle> make_handle(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks) = 0;

private:
	std::string pool_name_;
	std::size_t max_workers_;
	std::atomic_size_t active_workers_ = 0;

	std::mutex queue_mutex_;
	std::condition_variable queue_cv_;
	std::deque<std::shared_ptr<QueuedTaskHandle>> queue_;
	bool shutting_down_ = false;

	std::vector<std::jthread> workers_;

	static void thread_body(QueuedExecutionStrategy& pool);
};

#endif //MEDIAFORGE_QUEUED_EXECUTION_STRATEGY_HPP
