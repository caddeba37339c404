#include "model/task.hpp"

#include <cstdint>


namespace
{
	int64_t to_epoch_millis(TaskRecord::clock::time_point time_point)
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
	}
}

bool is_terminal(TaskStatus status) noexcept
{
	using enum TaskStatus;
	return status == COMPLETED || status == FAILED || status == CANCELLED;
}

bool can_transition(TaskStatus from, TaskStatus to) noexcept
{
	using enum TaskStatus;
	switch(from)
	{
		case PENDING:
			return to == RUNNING || to == CANCELLED;
		case RUNNING:
			return to == COMPLETED || to == FAILED || to == CANCELLED;
		case COMPLETED:
		case FAILED:
		case CANCELLED:
			return false;
	}

	return false;
}

std::string_view to_string(TaskStatus status) noexcept
{
	using enum TaskStatus;
	switch(status)
	{
		case PENDING:
			return "pending";
		case RUNNING:
			return "running";
		case COMPLETED:
			return "completed";
		case FAILED:
			return "failed";
		case CANCELLED:
			return "cancelled";
	}

	return "unknown";
}

std::optional<std::chrono::milliseconds> TaskRecord::duration() const
{
	if(!started_at.has_value())
	{
		return std::nullopt;
	}

	const auto end = ended_at.value_or(clock::now());
	return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at.value());
}

void to_json(nlohmann::json& json, const TaskRecord& record)
{
	json = nlohmann::json{
		{"id", record.id},
		{"label", record.label},
		{"status", to_string(record.status)},
		{"progress", record.progress},
		{"submittedAt", to_epoch_millis(record.submitted_at)},
		{"result", record.result.value_or(nullptr)},
		{"error", record.error.has_value() ? nlohmann::json(record.error.value()) : nlohmann::json(nullptr)}
	};

	json["startedAt"] = record.started_at.has_value() ? nlohmann::json(to_epoch_millis(record.started_at.value())) : nlohmann::json(nullptr);
	json["endedAt"] = record.ended_at.has_value() ? nlohmann::json(to_epoch_millis(record.ended_at.value())) : nlohmann::json(nullptr);

	if(const auto elapsed = record.duration(); elapsed.has_value())
	{
		json["durationMs"] = elapsed->count();
	}
}
