#include "service/progress_tracker.hpp"

#include <algorithm>
#include <numeric>

#include <spdlog/spdlog.h>


void ProgressTracker::add_listener(Listener listener)
{
	std::unique_lock lock(mutex_);
	listeners_.emplace_back(std::move(listener));
}

void ProgressTracker::start_tracking(const std::string& key)
{
	std::unique_lock lock(mutex_);
	items_.insert_or_assign(key, 0.0);
}

void ProgressTracker::update_progress(const std::string& key, double progress)
{
	const double clamped = std::clamp(progress, 0.0, 100.0);

	std::vector<Listener> listeners;
	{
		std::unique_lock lock(mutex_);

		const auto item_iter = items_.find(key);
		if(item_iter == std::end(items_))
		{
			spdlog::debug("Progress update for untracked item {}", key);
			return;
		}

		item_iter->second = clamped;

		listeners = listeners_;
	}

	for(const auto& listener: listeners)
	{
		try
		{
			listener(key, clamped);
		}
		catch(const std::exception& error)
		{
			spdlog::error("Progress listener failed: {}", error.what());
		}
	}
}

void ProgressTracker::stop_tracking(const std::string& key)
{
	std::unique_lock lock(mutex_);
	items_.erase(key);
}

std::optional<double> ProgressTracker::progress_of(const std::string& key) const
{
	std::unique_lock lock(mutex_);

	const auto item_iter = items_.find(key);
	if(item_iter == std::end(items_))
	{
		return std::nullopt;
	}

	return item_iter->second;
}

double ProgressTracker::overall_progress() const
{
	std::unique_lock lock(mutex_);

	if(items_.empty())
	{
		return 0.0;
	}

	const double total = std::accumulate(
			std::begin(items_), std::end(items_), 0.0,
			[](double sum, const auto& entry)
			{
				return sum + entry.second;
			}
	);

	return total / static_cast<double>(items_.size());
}

std::size_t ProgressTracker::tracked_count() const
{
	std::unique_lock lock(mutex_);
	return items_.size();
}
