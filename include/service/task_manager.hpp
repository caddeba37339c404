#ifndef MEDIAFORGE_TASK_MANAGER_HPP
#define MEDIAFORGE_TASK_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "execution/job.hpp"
#include "execution/strategy/execution_strategy_factory.hpp"
#include "execution/strategy/i_execution_strategy.hpp"
#include "model/statistics.hpp"
#include "model/task.hpp"


struct TaskManagerConfig
{
	std::size_t max_workers = 4;
	ExecutorKind executor_kind = ExecutorKind::THREADS;
};

/// Owns the bookkeeping of every submitted job. All record mutations happen under
/// tasks_mutex_; job bodies and blocking waits never hold it.
class TaskManager
{
public:
	explicit TaskManager(TaskManagerConfig config = {});
	~TaskManager();

	TaskManager(const TaskManager&) = delete;
	TaskManager& operator=(const TaskManager&) = delete;

	void start();

	[[nodiscard]] TaskId submit(std::shared_ptr<Job> job, ProgressSink progress_sink = {});

	[[nodiscard]] std::optional<TaskRecord> get_status(const TaskId& task_id) const;

	/// Snapshot of every record in submission order.
	[[nodiscard]] std::vector<TaskRecord> list_all() const;

	bool cancel(const TaskId& task_id);

	/// Waits for the given tasks (every known task if none are given). On timeout
	/// only the tasks that already reached a terminal state are returned.
	std::unordered_map<TaskId, TaskRecord> wait_for_completion(
			const std::optional<std::vector<TaskId>>& task_ids = std::nullopt,
			std::optional<std::chrono::milliseconds> timeout = std::nullopt
	);

	/// Blocks until the jobs behind the given tasks have returned. A record cancelled while
	/// running is terminal at once, but its job may still be unwinding.
	void wait_until_stopped(const std::vector<TaskId>& task_ids) const;

	[[nodiscard]] Statistics get_statistics() const;

	void shutdown(bool wait = true);

	[[nodiscard]] std::size_t max_workers() const noexcept;
	[[nodiscard]] bool is_started() const;

private:
	struct TaskEntry
	{
		TaskRecord record;
		std::shared_ptr<IExecutionStrategy::TaskHandle> handle;
	};

	struct Counters
	{
		std::size_t submitted = 0;
		std::size_t completed = 0;
		std::size_t failed = 0;
		std::size_t cancelled = 0;
	};

	TaskManagerConfig config_;

	std::mutex lifecycle_mutex_;

	mutable std::mutex tasks_mutex_;
	std::condition_variable tasks_cv_;

	std::unordered_map<TaskId, TaskEntry> tasks_;
	std::vector<TaskId> submission_order_;
	Counters counters_;

	bool shut_down_ = false;

	std::unique_ptr<IExecutionStrategy> strategy_;

	void start_locked();

	bool transition_locked(TaskRecord& record, TaskStatus status);

	IExecutionStrategy::TaskHandle::Callbacks build_callbacks(const TaskId& task_id, ProgressSink progress_sink);

	void handle_task_started(const TaskId& task_id);
	void handle_task_progress(const TaskId& task_id, const ProgressSnapshot& snapshot);
	void handle_task_completed(const TaskId& task_id, const IExecutionStrategy::TaskHandle& handle);
};

#endif //MEDIAFORGE_TASK_MANAGER_HPP
