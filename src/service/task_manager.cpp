#include "service/task_manager.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

#include "service/common_exceptions.hpp"
#include "utils/uuid.hpp"


TaskManager::TaskManager(TaskManagerConfig config)
	: config_(config)
{
	spdlog::info("Task manager created: max_workers={}, executor={}", config_.max_workers, to_string(config_.executor_kind));
}

TaskManager::~TaskManager()
{
	try
	{
		shutdown(true);
	}
	catch(const std::exception& error)
	{
		spdlog::error("Task manager shutdown failed: {}", error.what());
	}
}

void TaskManager::start()
{
	std::unique_lock lock(tasks_mutex_);
	start_locked();
}

void TaskManager::start_locked()
{
	if(strategy_)
	{
		spdlog::warn("Task manager is already started");
		return;
	}

	if(shut_down_)
	{
		throw SubmissionError("Task manager is shut down");
	}

	try
	{
		strategy_ = make_execution_strategy(config_.executor_kind, config_.max_workers);
	}
	catch(const std::exception& error)
	{
		spdlog::error("Failed to start executor: {}", error.what());
		throw SubmissionError(std::string("Failed to start executor: ") + error.what());
	}

	spdlog::info("{} started: {} workers", strategy_->kind(), strategy_->max_workers());
}

TaskId TaskManager::submit(std::shared_ptr<Job> job, ProgressSink progress_sink)
{
	if(!job)
	{
		throw std::invalid_argument("Cannot submit an empty job");
	}

	const TaskId task_id = generate_uuid();

	std::unique_lock lock(tasks_mutex_);

	if(shut_down_)
	{
		throw SubmissionError("Task manager is shut down");
	}

	if(!strategy_)
	{
		start_locked();
	}

	TaskRecord record;
	record.id = task_id;
	record.label = job->name();
	record.submitted_at = TaskRecord::clock::now();

	const auto [entry_iter, inserted] = tasks_.try_emplace(task_id, TaskEntry{std::move(record), nullptr});
	if(!inserted)
	{
		throw SubmissionError("Task identifier collision: " + task_id);
	}

	try
	{
		entry_iter->second.handle = strategy_->schedule(job, build_callbacks(task_id, std::move(progress_sink)));
	}
	catch(const std::exception& error)
	{
		tasks_.erase(entry_iter);
		spdlog::error("Task submission failed: {}", error.what());
		throw SubmissionError(std::string("Task submission failed: ") + error.what());
	}

	submission_order_.emplace_back(task_id);
	++counters_.submitted;

	spdlog::debug("Task submitted: {} - {}", task_id, job->name());

	return task_id;
}

std::optional<TaskRecord> TaskManager::get_status(const TaskId& task_id) const
{
	std::unique_lock lock(tasks_mutex_);

	const auto entry_iter = tasks_.find(task_id);
	if(entry_iter == std::end(tasks_))
	{
		return std::nullopt;
	}

	return entry_iter->second.record;
}

std::vector<TaskRecord> TaskManager::list_all() const
{
	std::unique_lock lock(tasks_mutex_);

	std::vector<TaskRecord> records;
	records.reserve(submission_order_.size());

	std::ranges::transform(
			submission_order_,
			std::back_inserter(records),
			[this](const TaskId& task_id)
			{
				return tasks_.at(task_id).record;
			}
	);

	return records;
}

bool TaskManager::cancel(const TaskId& task_id)
{
	std::shared_ptr<IExecutionStrategy::TaskHandle> handle;
	{
		std::unique_lock lock(tasks_mutex_);

		const auto entry_iter = tasks_.find(task_id);
		if(entry_iter == std::end(tasks_))
		{
			spdlog::warn("Task not found: {}", task_id);
			return false;
		}

		const auto& record = entry_iter->second.record;
		if(is_terminal(record.status))
		{
			spdlog::warn("Task {} already finished as {}", task_id, to_string(record.status));
			return false;
		}

		handle = entry_iter->second.handle;
	}

	const auto outcome = handle->cancel();
	if(outcome == IExecutionStrategy::TaskHandle::CancelOutcome::ALREADY_FINISHED)
	{
		spdlog::warn("Task {} finished before it could be cancelled", task_id);
		return false;
	}

	{
		std::unique_lock lock(tasks_mutex_);
		transition_locked(tasks_.at(task_id).record, TaskStatus::CANCELLED);
	}
	tasks_cv_.notify_all();

	if(outcome == IExecutionStrategy::TaskHandle::CancelOutcome::CANCELLED_BEFORE_START)
	{
		spdlog::info("Task cancelled before start: {}", task_id);
	}
	else
	{
		spdlog::info("Task cancelled while running, stop requested: {}", task_id);
	}

	return true;
}

std::unordered_map<TaskId, TaskRecord> TaskManager::wait_for_completion(
		const std::optional<std::vector<TaskId>>& task_ids,
		std::optional<std::chrono::milliseconds> timeout
)
{
	std::unique_lock lock(tasks_mutex_);

	std::vector<TaskId> awaited;
	if(task_ids.has_value())
	{
		std::ranges::copy_if(
				task_ids.value(),
				std::back_inserter(awaited),
				[this](const TaskId& task_id)
				{
					return tasks_.contains(task_id);
				}
		);
	}
	else
	{
		awaited = submission_order_;
	}

	const auto all_finished = [this, &awaited]()
	{
		return std::ranges::all_of(
				awaited,
				[this](const TaskId& task_id)
				{
					return is_terminal(tasks_.at(task_id).record.status);
				}
		);
	};

	if(timeout.has_value())
	{
		if(!tasks_cv_.wait_for(lock, timeout.value(), all_finished))
		{
			spdlog::warn("Waiting for task completion timed out after {} ms", timeout->count());
		}
	}
	else
	{
		tasks_cv_.wait(lock, all_finished);
	}

	std::unordered_map<TaskId, TaskRecord> finished;
	for(const auto& task_id: awaited)
	{
		const auto& record = tasks_.at(task_id).record;
		if(is_terminal(record.status))
		{
			finished.try_emplace(task_id, record);
		}
	}

	return finished;
}

void TaskManager::wait_until_stopped(const std::vector<TaskId>& task_ids) const
{
	std::vector<std::shared_ptr<IExecutionStrategy::TaskHandle>> handles;
	{
		std::unique_lock lock(tasks_mutex_);
		for(const auto& task_id: task_ids)
		{
			const auto entry_iter = tasks_.find(task_id);
			if(entry_iter != std::end(tasks_) && entry_iter->second.handle)
			{
				handles.emplace_back(entry_iter->second.handle);
			}
		}
	}

	for(const auto& handle: handles)
	{
		handle->wait();
	}
}

Statistics TaskManager::get_statistics() const
{
	std::unique_lock lock(tasks_mutex_);

	Statistics statistics;
	statistics.submitted = counters_.submitted;
	statistics.completed = counters_.completed;
	statistics.failed = counters_.failed;
	statistics.cancelled = counters_.cancelled;

	for(const auto& [task_id, entry]: tasks_)
	{
		if(entry.record.status == TaskStatus::PENDING)
		{
			++statistics.pending;
		}
		else if(entry.record.status == TaskStatus::RUNNING)
		{
			++statistics.running;
		}
	}

	statistics.active_workers = strategy_ ? strategy_->active_workers() : 0;
	statistics.max_workers = config_.max_workers;
	statistics.executor_kind = to_string(config_.executor_kind);

	return statistics;
}

void TaskManager::shutdown(bool wait)
{
	std::unique_lock lifecycle_lock(lifecycle_mutex_);

	std::vector<std::pair<TaskId, std::shared_ptr<IExecutionStrategy::TaskHandle>>> outstanding;
	IExecutionStrategy* strategy = nullptr;
	{
		std::unique_lock lock(tasks_mutex_);

		const bool first_shutdown = !shut_down_;
		shut_down_ = true;

		if(!strategy_)
		{
			return;
		}

		if(first_shutdown)
		{
			spdlog::info("Shutting down task manager...");
			for(const auto& task_id: submission_order_)
			{
				const auto& entry = tasks_.at(task_id);
				if(!is_terminal(entry.record.status))
				{
					outstanding.emplace_back(task_id, entry.handle);
				}
			}
		}

		strategy = strategy_.get();
	}

	std::size_t cancelled_count = 0;
	for(const auto& [task_id, handle]: outstanding)
	{
		if(handle->cancel() == IExecutionStrategy::TaskHandle::CancelOutcome::ALREADY_FINISHED)
		{
			continue;
		}

		std::unique_lock lock(tasks_mutex_);
		transition_locked(tasks_.at(task_id).record, TaskStatus::CANCELLED);
		++cancelled_count;
	}
	tasks_cv_.notify_all();

	if(cancelled_count > 0)
	{
		spdlog::info("Cancelled {} unfinished tasks", cancelled_count);
	}

	strategy->shutdown(wait);

	if(wait)
	{
		std::unique_ptr<IExecutionStrategy> released;
		{
			std::unique_lock lock(tasks_mutex_);
			released = std::move(strategy_);
		}
		spdlog::info("Task manager shut down");
	}
}

std::size_t TaskManager::max_workers() const noexcept
{
	return config_.max_workers;
}

bool TaskManager::is_started() const
{
	std::unique_lock lock(tasks_mutex_);
	return strategy_ != nullptr;
}

bool TaskManager::transition_locked(TaskRecord& record, TaskStatus status)
{
	if(!can_transition(record.status, status))
	{
		return false;
	}

	const auto now = TaskRecord::clock::now();
	record.status = status;

	switch(status)
	{
		case TaskStatus::RUNNING:
			record.started_at = now;
			break;
		case TaskStatus::COMPLETED:
			record.ended_at = now;
			++counters_.completed;
			break;
		case TaskStatus::FAILED:
			record.ended_at = now;
			++counters_.failed;
			break;
		case TaskStatus::CANCELLED:
			record.ended_at = now;
			++counters_.cancelled;
			break;
		case TaskStatus::PENDING:
			break;
	}

	return true;
}

IExecutionStrategy::TaskHandle::Callbacks TaskManager::build_callbacks(const TaskId& task_id, ProgressSink progress_sink)
{
	return IExecutionStrategy::TaskHandle::Callbacks{
		[this, task_id]()
		{
			handle_task_started(task_id);
		},
		[this, task_id, sink = std::move(progress_sink)](const ProgressSnapshot& snapshot)
		{
			handle_task_progress(task_id, snapshot);

			if(!sink)
			{
				return;
			}

			try
			{
				sink(snapshot);
			}
			catch(const std::exception& error)
			{
				spdlog::error("Progress sink of task {} failed: {}", task_id, error.what());
			}
		},
		[this, task_id](const IExecutionStrategy::TaskHandle& handle)
		{
			handle_task_completed(task_id, handle);
		}
	};
}

void TaskManager::handle_task_started(const TaskId& task_id)
{
	std::unique_lock lock(tasks_mutex_);

	const auto entry_iter = tasks_.find(task_id);
	if(entry_iter == std::end(tasks_))
	{
		return;
	}

	if(transition_locked(entry_iter->second.record, TaskStatus::RUNNING))
	{
		spdlog::debug("Task started: {} - {}", task_id, entry_iter->second.record.label);
	}
}

void TaskManager::handle_task_progress(const TaskId& task_id, const ProgressSnapshot& snapshot)
{
	std::unique_lock lock(tasks_mutex_);

	const auto entry_iter = tasks_.find(task_id);
	if(entry_iter == std::end(tasks_))
	{
		return;
	}

	auto& record = entry_iter->second.record;
	if(record.status == TaskStatus::RUNNING)
	{
		record.progress = std::clamp(snapshot.percentage, 0.0, 100.0);
	}
}

void TaskManager::handle_task_completed(const TaskId& task_id, const IExecutionStrategy::TaskHandle& handle)
{
	using Status = IExecutionStrategy::TaskHandle::Status;

	try
	{
		const auto status = handle.status();
		{
			std::unique_lock lock(tasks_mutex_);

			const auto entry_iter = tasks_.find(task_id);
			if(entry_iter == std::end(tasks_))
			{
				spdlog::warn("Completion reported for unknown task: {}", task_id);
				return;
			}

			auto& record = entry_iter->second.record;
			switch(status)
			{
				case Status::COMPLETED:
				{
					if(transition_locked(record, TaskStatus::COMPLETED))
					{
						record.result = handle.result();
						record.progress = 100.0;
						spdlog::debug("Task completed: {}", task_id);
					}
					break;
				}
				case Status::FAILED:
				{
					if(transition_locked(record, TaskStatus::FAILED))
					{
						record.error = handle.error().value_or("unknown error");
						spdlog::error("Task failed: {} - {}", task_id, record.error.value());
					}
					break;
				}
				case Status::CANCELLED:
				{
					if(transition_locked(record, TaskStatus::CANCELLED))
					{
						spdlog::debug("Task cancelled: {}", task_id);
					}
					break;
				}
				default:
				{
					spdlog::warn("Task {} reported completion while still {}", task_id, static_cast<int>(status));
					break;
				}
			}
		}
		tasks_cv_.notify_all();
	}
	catch(const std::exception& error)
	{
		spdlog::error("Completion handling of task {} failed: {}", task_id, error.what());
	}
}
