#include "model/statistics.hpp"


void to_json(nlohmann::json& json, const Statistics& statistics)
{
	json = nlohmann::json{
		{"totalTasks", statistics.submitted},
		{"completedTasks", statistics.completed},
		{"failedTasks", statistics.failed},
		{"cancelledTasks", statistics.cancelled},
		{"runningTasks", statistics.running},
		{"pendingTasks", statistics.pending},
		{"activeWorkers", statistics.active_workers},
		{"maxWorkers", statistics.max_workers},
		{"executorKind", statistics.executor_kind}
	};
}
