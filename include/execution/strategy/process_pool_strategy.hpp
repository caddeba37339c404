#ifndef MEDIAFORGE_PROCESS_POOL_STRATEGY_HPP
#define MEDIAFORGE_PROCESS_POOL_STRATEGY_HPP

#include <sys/types.h>

#include <chrono>
#include <mutex>

#include "execution/strategy/queued_execution_strategy.hpp"


/// Runs every job in its own forked worker process. Progress and the outcome travel
/// back over a pipe. Cancelling a running job sends SIGTERM to its worker, which turns
/// it into a stop request for the job; a job still running after TERMINATION_GRACE is
/// killed together with everything it started.
class ProcessPoolStrategy final: public QueuedExecutionStrategy
{
public:
	constexpr static std::chrono::seconds TERMINATION_GRACE{2};

	class ProcessTaskHandle final: public QueuedTaskHandle
	{
	public:
		using QueuedTaskHandle::QueuedTaskHandle;

	private:
		std::mutex process_mutex_;
		pid_t pid_ = 0;

		void execute() override;
		void interrupt() override;

		void attach_process(pid_t pid);
		void detach_process();
	};

	explicit ProcessPoolStrategy(std::size_t max_workers);

	[[nodiscard]] std::string_view kind() const noexcept override;

protected:
	std::shared_ptr<QueuedTaskHandle> make_handle(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks) override;
};

#endif //MEDIAFORGE_PROCESS_POOL_STRATEGY_HPP
