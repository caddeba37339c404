#ifndef MEDIAFORGE_THREAD_POOL_STRATEGY_HPP
#define MEDIAFORGE_THREAD_POOL_STRATEGY_HPP

#include <stop_token>

#include "execution/strategy/queued_execution_strategy.hpp"


class ThreadPoolStrategy final: public QueuedExecutionStrategy
{
public:
	class ThreadTaskHandle final: public QueuedTaskHandle
	{
	public:
		using QueuedTaskHandle::QueuedTaskHandle;

	private:
		std::stop_source stop_source_;

		void execute() override;
		void interrupt() override;
	};

	explicit ThreadPoolStrategy(std::size_t max_workers);

	[[nodiscard]] std::string_view kind() const noexcept override;

protected:
	std::shared_ptr<QueuedTaskHandle> make_handle(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks) override;
};

#endif //MEDIAFORGE_THREAD_POOL_STRATEGY_HPP
