#ifndef MEDIAFORGE_PROGRESS_TRACKER_HPP
#define MEDIAFORGE_PROGRESS_TRACKER_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>


/// Aggregates progress of a set of tracked items and fans updates out to listeners.
class ProgressTracker
{
public:
	using Listener = std::function<void(const std::string& key, double progress)>;

	void add_listener(Listener listener);

	void start_tracking(const std::string& key);
	void update_progress(const std::string& key, double progress);
	void stop_tracking(const std::string& key);

	[[nodiscard]] std::optional<double> progress_of(const std::string& key) const;

	/// Mean progress of all tracked items, 0 when nothing is tracked.
	[[nodiscard]] double overall_progress() const;
	[[nodiscard]] std::size_t tracked_count() const;

private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, double> items_;
	std::vector<Listener> listeners_;
};

#endif //MEDIAFORGE_PROGRESS_TRACKER_HPP
