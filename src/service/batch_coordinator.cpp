#include "service/batch_coordinator.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "service/progress_tracker.hpp"


BatchCoordinator::BatchCoordinator(TaskManager& task_manager)
	: task_manager_(task_manager)
{
}

BatchCoordinator::RoundsSummary BatchCoordinator::run_rounds(
		std::size_t item_count,
		const std::function<std::shared_ptr<Job>(std::size_t)>& job_factory,
		const Options& options
)
{
	const std::size_t batch_size = options.batch_size > 0 ? options.batch_size : task_manager_.max_workers();
	if(batch_size == 0)
	{
		throw std::invalid_argument("Batch size must be positive");
	}

	const std::size_t round_count = (item_count + batch_size - 1) / batch_size;

	// Task handles keep their progress sinks after this call returns.
	auto tracker = std::make_shared<ProgressTracker>();
	for(std::size_t index = 0; index < item_count; ++index)
	{
		tracker->start_tracking(std::to_string(index));
	}

	if(options.on_progress)
	{
		tracker->add_listener(
			[tracker_ptr = tracker.get(), on_progress = options.on_progress](const std::string&, double)
			{
				on_progress(tracker_ptr->overall_progress());
			}
		);
	}

	RoundsSummary summary;
	summary.outcomes.reserve(item_count);

	for(std::size_t round = 0; round < round_count; ++round)
	{
		const std::size_t round_begin = round * batch_size;
		const std::size_t round_end = std::min(round_begin + batch_size, item_count);

		spdlog::info("Batch round {}/{}: {} items", round + 1, round_count, round_end - round_begin);

		std::vector<std::pair<std::size_t, TaskId>> submitted;
		submitted.reserve(round_end - round_begin);

		for(std::size_t index = round_begin; index < round_end; ++index)
		{
			const auto key = std::to_string(index);
			try
			{
				auto task_id = task_manager_.submit(
						job_factory(index),
						[tracker, key](const ProgressSnapshot& snapshot)
						{
							tracker->update_progress(key, snapshot.percentage);
						}
				);
				submitted.emplace_back(index, std::move(task_id));
			}
			catch(const std::exception& error)
			{
				spdlog::error("Failed to submit batch item {}: {}", index, error.what());
				summary.outcomes.push_back({index, std::nullopt, std::nullopt, error.what()});
				tracker->update_progress(key, 100.0);
			}
		}

		std::vector<TaskId> round_task_ids;
		round_task_ids.reserve(submitted.size());
		std::ranges::transform(submitted, std::back_inserter(round_task_ids), [](const auto& entry) { return entry.second; });

		const auto finished = task_manager_.wait_for_completion(round_task_ids, options.round_timeout);

		std::vector<TaskId> timed_out;
		for(const auto& [index, task_id]: submitted)
		{
			std::optional<TaskRecord> record;
			if(const auto record_iter = finished.find(task_id); record_iter != std::end(finished))
			{
				record = record_iter->second;
			}
			else if(task_manager_.cancel(task_id))
			{
				spdlog::warn("Batch item {} did not finish within the round timeout and was cancelled", index);
				timed_out.emplace_back(task_id);
			}
			else
			{
				// Finished between the timeout and the cancel request.
				const auto late = task_manager_.wait_for_completion(std::vector<TaskId>{task_id});
				if(const auto late_iter = late.find(task_id); late_iter != std::end(late))
				{
					record = late_iter->second;
				}
			}

			if(!record.has_value())
			{
				summary.outcomes.push_back({index, task_id, std::nullopt, std::string(TIMEOUT_ERROR)});
			}
			else if(record->status == TaskStatus::COMPLETED)
			{
				summary.outcomes.push_back({index, task_id, record->result.value_or(JobResult()), {}});
			}
			else if(record->status == TaskStatus::CANCELLED)
			{
				summary.outcomes.push_back({index, task_id, std::nullopt, std::string(CANCELLED_ERROR)});
			}
			else
			{
				summary.outcomes.push_back({index, task_id, std::nullopt, record->error.value_or("unknown error")});
			}

			tracker->update_progress(std::to_string(index), 100.0);
		}

		// The next round may only take worker slots once the cancelled jobs have released theirs.
		task_manager_.wait_until_stopped(timed_out);

		++summary.rounds;
	}

	std::ranges::sort(summary.outcomes, {}, &ItemOutcome::index);

	spdlog::info("Batch finished: {} items in {} rounds", item_count, summary.rounds);

	return summary;
}
