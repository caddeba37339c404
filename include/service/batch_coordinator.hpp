#ifndef MEDIAFORGE_BATCH_COORDINATOR_HPP
#define MEDIAFORGE_BATCH_COORDINATOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "execution/job.hpp"
#include "model/task.hpp"
#include "service/task_manager.hpp"


template<typename Item>
struct BatchResult
{
	struct CompletedItem
	{
		Item item;
		TaskId task_id;
		JobResult result;
	};

	struct FailedItem
	{
		Item item;
		std::optional<TaskId> task_id;
		std::string error;
	};

	std::vector<CompletedItem> completed;
	std::vector<FailedItem> failed;
	std::size_t total = 0;
	std::size_t rounds = 0;
};

/// Applies one job-shaped operation to every item, batch_size items per round.
/// Rounds run strictly one after another; items of a round run concurrently.
class BatchCoordinator
{
public:
	constexpr static std::string_view TIMEOUT_ERROR = "timed out waiting for task completion";
	constexpr static std::string_view CANCELLED_ERROR = "task was cancelled";

	struct Options
	{
		/// 0 selects the task manager's worker count.
		std::size_t batch_size = 0;
		std::optional<std::chrono::milliseconds> round_timeout;
		std::function<void(double)> on_progress;
	};

	explicit BatchCoordinator(TaskManager& task_manager);

	template<typename Item, typename JobFactory>
	BatchResult<Item> process(const std::vector<Item>& items, JobFactory job_factory)
	{
		return process(items, std::move(job_factory), Options{});
	}

	template<typename Item, typename JobFactory>
	BatchResult<Item> process(const std::vector<Item>& items, JobFactory job_factory, const Options& options)
	{
		const auto summary = run_rounds(
				items.size(),
				[&items, &job_factory](std::size_t index) -> std::shared_ptr<Job>
				{
					return job_factory(items[index]);
				},
				options
		);

		BatchResult<Item> result;
		result.total = items.size();
		result.rounds = summary.rounds;

		for(const auto& outcome: summary.outcomes)
		{
			if(outcome.result.has_value())
			{
				result.completed.push_back({items[outcome.index], outcome.task_id.value(), outcome.result.value()});
			}
			else
			{
				result.failed.push_back({items[outcome.index], outcome.task_id, outcome.error});
			}
		}

		return result;
	}

private:
	struct ItemOutcome
	{
		std::size_t index;
		std::optional<TaskId> task_id;
		std::optional<JobResult> result;
		std::string error;
	};

	struct RoundsSummary
	{
		std::vector<ItemOutcome> outcomes;
		std::size_t rounds = 0;
	};

	TaskManager& task_manager_;

	RoundsSummary run_rounds(std::size_t item_count, const std::function<std::shared_ptr<Job>(std::size_t)>& job_factory, const Options& options);
};

#endif //MEDIAFORGE_BATCH_COORDINATOR_HPP
