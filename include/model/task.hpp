#ifndef MEDIAFORGE_TASK_HPP
#define MEDIAFORGE_TASK_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>


using TaskId = std::string;
using JobResult = nlohmann::json;

enum class TaskStatus
{
	PENDING,
	RUNNING,
	COMPLETED,
	FAILED,
	CANCELLED
};

[[nodiscard]] bool is_terminal(TaskStatus status) noexcept;

/// PENDING -> RUNNING -> {COMPLETED | FAILED}, {PENDING | RUNNING} -> CANCELLED.
/// Terminal states have no outgoing edges.
[[nodiscard]] bool can_transition(TaskStatus from, TaskStatus to) noexcept;

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

struct TaskRecord
{
	using clock = std::chrono::system_clock;

	TaskId id;
	std::string label;
	TaskStatus status = TaskStatus::PENDING;

	std::optional<JobResult> result;
	std::optional<std::string> error;

	clock::time_point submitted_at;
	std::optional<clock::time_point> started_at;
	std::optional<clock::time_point> ended_at;

	double progress = 0.0;

	[[nodiscard]] std::optional<std::chrono::milliseconds> duration() const;
};

void to_json(nlohmann::json& json, const TaskRecord& record);

#endif //MEDIAFORGE_TASK_HPP
