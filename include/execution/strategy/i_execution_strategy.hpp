#ifndef MEDIAFORGE_I_EXECUTION_STRATEGY_HPP
#define MEDIAFORGE_I_EXECUTION_STRATEGY_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "execution/job.hpp"
#include "model/progress.hpp"
#include "model/task.hpp"


class IExecutionStrategy
{
public:
	class TaskHandle
	{
	public:
		enum class Status
		{
			PENDING,
			RUNNING,
			COMPLETED,
			FAILED,
			CANCELLED
		};

		enum class CancelOutcome
		{
			CANCELLED_BEFORE_START,
			STOP_REQUESTED,
			ALREADY_FINISHED
		};

		/// Registered at schedule time, so no notification can be missed.
		/// on_completed fires exactly once, on the thread that finished the task.
		struct Callbacks
		{
			std::function<void()> on_started;
			ProgressSink on_progress;
			std::function<void(const TaskHandle&)> on_completed;
		};

		TaskHandle(std::shared_ptr<Job> job, Callbacks callbacks);
		virtual ~TaskHandle() noexcept = default;

		TaskHandle(const TaskHandle&) = delete;
		TaskHandle& operator=(const TaskHandle&) = delete;

		[[nodiscard]] Status status() const noexcept;
		[[nodiscard]] bool is_done() const noexcept;
		[[nodiscard]] bool cancel_requested() const noexcept;

		[[nodiscard]] std::optional<JobResult> result() const;
		[[nodiscard]] std::optional<std::string> error() const;

		[[nodiscard]] const Job& job() const noexcept;

		void wait() const;

		/// Queued tasks are cancelled for sure. Running tasks are asked to stop and
		/// finish as CANCELLED whenever they return.
		CancelOutcome cancel();

	protected:
		std::shared_ptr<Job> job_;

		[[nodiscard]] bool mark_running();
		void mark_completed(JobResult result);
		void mark_failed(std::string error);

		void notify_progress(const ProgressSnapshot& snapshot) const;

		virtual void interrupt() = 0;

	private:
		Callbacks callbacks_;

		mutable std::mutex state_mutex_;
		mutable std::condition_variable state_cv_;

		Status status_ = Status::PENDING;
		std::atomic_bool cancel_requested_ = false;

		std::optional<JobResult> result_;
		std::optional<std::string> error_;

		void finish(Status status, std::optional<JobResult> result, std::optional<std::string> error);
		void notify_finished();
	};

	virtual ~IExecutionStrategy() = default;

	virtual std::shared_ptr<TaskHandle> schedule(std::shared_ptr<Job> job, TaskHandle::Callbacks callbacks) = 0;

	[[nodiscard]] virtual std::size_t max_workers() const noexcept = 0;
	[[nodiscard]] virtual std::size_t active_workers() const noexcept = 0;
	[[nodiscard]] virtual std::string_view kind() const noexcept = 0;

	/// Stops accepting work and cancels everything still queued. With wait set,
	/// blocks until every worker has exited.
	virtual void shutdown(bool wait) = 0;
};

struct StrategyShutDownException: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

#endif //MEDIAFORGE_I_EXECUTION_STRATEGY_HPP
